#include "internal/manifest/partitioner.hpp"

#include "internal/util/errors.hpp"

namespace sitepull::manifest {

Partition PartitionManifest(const std::vector<sitepull::core::v1::ManifestEntry>& entries, const PartitionOptions& options) {
  if (options.batch_byte_cap == 0 || options.batch_count_cap == 0) {
    throw util::ValidationError("batch caps must be positive");
  }

  Partition partition;
  Batch     current;

  auto close_batch = [&] {
    if (current.files.empty()) return;
    partition.batches.push_back(std::move(current));
    current = Batch{};
  };

  for (const auto& entry : entries) {
    partition.total_files += 1;
    partition.total_bytes += entry.size();

    FileDescriptor file{entry.path(), entry.size()};
    if (entry.size() > options.large_threshold) {
      partition.large.push_back(std::move(file));
      continue;
    }

    const bool count_full = current.files.size() + 1 > options.batch_count_cap;
    const bool bytes_full = current.total_bytes + file.size > options.batch_byte_cap;
    if (!current.files.empty() && (count_full || bytes_full)) {
      close_batch();
    }

    current.total_bytes += file.size;
    current.files.push_back(std::move(file));
  }
  close_batch();

  return partition;
}

} // namespace sitepull::manifest
