#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <vector>

#include "internal/manifest/partitioner.hpp"
#include "progress.hpp"
#include "transport.hpp"

namespace sitepull::transfer {

/*
  One network transfer: a single large file or a batch of small ones.
*/
struct RetrievalUnit {
  enum class Kind { kLargeFile, kBatch };

  Kind                                  kind = Kind::kBatch;
  std::vector<manifest::FileDescriptor> files;
  std::uint64_t                         total_bytes = 0;
};

// Large files first, then batches, each in partition order.
std::vector<RetrievalUnit> BuildUnits(const manifest::Partition& partition);

struct RetrievalOptions {
  std::uint32_t             concurrency  = 4;
  std::uint32_t             max_attempts = 3;
  std::chrono::milliseconds retry_backoff{500};
};

/*
  Bounded worker pool that pulls units from a shared queue, writes files
  under the destination root and reports one result per unit to a single
  collector.

  Retryable transport failures are attempted again with linear backoff;
  a batch retry only asks for the files not yet completed. Validation and
  local storage failures fail the unit at once. A failed unit never stops
  the others.
*/
class RetrievalEngine {
 public:
  using ProgressFn = std::function<void(std::uint64_t bytes)>;

  RetrievalEngine(std::shared_ptr<Transport> transport, RetrievalOptions options, ProgressAggregator* progress = nullptr);

  // on_progress runs on worker threads once per committed file, with its
  // size (zero for an empty file). Bytes of an abandoned attempt are never
  // reported.
  TransferResult Retrieve(const std::vector<RetrievalUnit>& units, const std::filesystem::path& destination_root,
                          const ProgressFn& on_progress = {});

 private:
  TransferResult RunUnit(const RetrievalUnit& unit, const std::filesystem::path& root, const ProgressFn& on_progress);

  void FetchLarge(const manifest::FileDescriptor& file, const std::filesystem::path& root, const ProgressFn& on_progress,
                  TransferResult* result);

  // Fetches `pending` in one stream, erasing every file it settles.
  void FetchBatch(std::vector<manifest::FileDescriptor>* pending, const std::filesystem::path& root, const ProgressFn& on_progress,
                  TransferResult* result);

  std::shared_ptr<Transport> transport_;
  RetrievalOptions           options_;
  ProgressAggregator*        progress_;
};

} // namespace sitepull::transfer
