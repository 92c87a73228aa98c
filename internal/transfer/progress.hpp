#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace sitepull::transfer {

/*
  Outcome of one or more retrieval units. Folding is commutative and
  associative, so completion order never matters.
*/
struct TransferResult {
  std::uint64_t files_succeeded   = 0;
  std::uint64_t files_failed      = 0;
  std::uint64_t bytes_transferred = 0;
  std::uint64_t units_succeeded   = 0;
  std::uint64_t units_failed      = 0;

  TransferResult& operator+=(const TransferResult& other);

  bool operator==(const TransferResult&) const = default;
};

TransferResult operator+(TransferResult lhs, const TransferResult& rhs);

struct ProgressSnapshot {
  std::uint64_t files_completed   = 0;
  std::uint64_t files_failed      = 0;
  std::uint64_t bytes_transferred = 0;
  std::uint64_t total_files       = 0;
  std::uint64_t total_bytes       = 0;
  std::uint64_t db_bytes          = 0;
  std::uint64_t db_tables_done    = 0;
  std::uint64_t db_tables_total   = 0;
};

/*
  Live counters for progress rendering.

  One atomic per counter: writers on any thread never lose an update and a
  reader never sees a torn value. A snapshot is consistent per counter, not
  across counters.
*/
class ProgressAggregator {
 public:
  void SetTotals(std::uint64_t files, std::uint64_t bytes);
  void SetDatabaseProgress(std::uint64_t bytes, std::uint64_t tables_done, std::uint64_t tables_total);

  void AddBytes(std::uint64_t bytes);
  void AddFilesCompleted(std::uint64_t files);
  void AddFilesFailed(std::uint64_t files);

  ProgressSnapshot Snapshot() const;

 private:
  std::atomic<std::uint64_t> files_completed_{0};
  std::atomic<std::uint64_t> files_failed_{0};
  std::atomic<std::uint64_t> bytes_transferred_{0};
  std::atomic<std::uint64_t> total_files_{0};
  std::atomic<std::uint64_t> total_bytes_{0};
  std::atomic<std::uint64_t> db_bytes_{0};
  std::atomic<std::uint64_t> db_tables_done_{0};
  std::atomic<std::uint64_t> db_tables_total_{0};
};

// One status line, e.g. "files 10/200 (1 failed) 3.2 MiB/40.0 MiB db 2/9 tables".
std::string FormatProgress(const ProgressSnapshot& snapshot);

} // namespace sitepull::transfer
