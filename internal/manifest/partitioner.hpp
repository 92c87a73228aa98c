#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "sitepull/core/v1/types.pb.h"

namespace sitepull::manifest {

struct FileDescriptor {
  std::string   path;
  std::uint64_t size = 0;
};

struct Batch {
  std::vector<FileDescriptor> files;
  std::uint64_t               total_bytes = 0;
};

struct Partition {
  std::vector<FileDescriptor> large;
  std::vector<Batch>          batches;
  std::uint64_t               total_files = 0;
  std::uint64_t               total_bytes = 0;
};

struct PartitionOptions {
  std::uint64_t large_threshold = 8ull * 1024 * 1024;
  std::uint64_t batch_byte_cap  = 16ull * 1024 * 1024;
  std::uint32_t batch_count_cap = 2000;
};

/*
  Splits a manifest into retrieval units in one pass.

  Files above large_threshold become their own unit. The rest are packed
  greedily in manifest order; a batch closes when the next file would push
  it past either cap, and always holds at least one file. Same input, same
  output.
*/
Partition PartitionManifest(const std::vector<sitepull::core::v1::ManifestEntry>& entries, const PartitionOptions& options = {});

} // namespace sitepull::manifest
