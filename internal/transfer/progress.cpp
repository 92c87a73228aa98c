#include "progress.hpp"

#include <sstream>

#include "internal/observability/logging.hpp"

namespace sitepull::transfer {

TransferResult& TransferResult::operator+=(const TransferResult& other) {
  files_succeeded += other.files_succeeded;
  files_failed += other.files_failed;
  bytes_transferred += other.bytes_transferred;
  units_succeeded += other.units_succeeded;
  units_failed += other.units_failed;
  return *this;
}

TransferResult operator+(TransferResult lhs, const TransferResult& rhs) {
  lhs += rhs;
  return lhs;
}

void ProgressAggregator::SetTotals(std::uint64_t files, std::uint64_t bytes) {
  total_files_.store(files, std::memory_order_relaxed);
  total_bytes_.store(bytes, std::memory_order_relaxed);
}

void ProgressAggregator::SetDatabaseProgress(std::uint64_t bytes, std::uint64_t tables_done, std::uint64_t tables_total) {
  db_bytes_.store(bytes, std::memory_order_relaxed);
  db_tables_done_.store(tables_done, std::memory_order_relaxed);
  db_tables_total_.store(tables_total, std::memory_order_relaxed);
}

void ProgressAggregator::AddBytes(std::uint64_t bytes) {
  bytes_transferred_.fetch_add(bytes, std::memory_order_relaxed);
}

void ProgressAggregator::AddFilesCompleted(std::uint64_t files) {
  files_completed_.fetch_add(files, std::memory_order_relaxed);
}

void ProgressAggregator::AddFilesFailed(std::uint64_t files) {
  files_failed_.fetch_add(files, std::memory_order_relaxed);
}

ProgressSnapshot ProgressAggregator::Snapshot() const {
  ProgressSnapshot s;
  s.files_completed   = files_completed_.load(std::memory_order_relaxed);
  s.files_failed      = files_failed_.load(std::memory_order_relaxed);
  s.bytes_transferred = bytes_transferred_.load(std::memory_order_relaxed);
  s.total_files       = total_files_.load(std::memory_order_relaxed);
  s.total_bytes       = total_bytes_.load(std::memory_order_relaxed);
  s.db_bytes          = db_bytes_.load(std::memory_order_relaxed);
  s.db_tables_done    = db_tables_done_.load(std::memory_order_relaxed);
  s.db_tables_total   = db_tables_total_.load(std::memory_order_relaxed);
  return s;
}

std::string FormatProgress(const ProgressSnapshot& s) {
  std::ostringstream out;
  out << "files " << s.files_completed << "/" << s.total_files;
  if (s.files_failed > 0) out << " (" << s.files_failed << " failed)";
  out << " " << observability::FormatBytes(s.bytes_transferred) << "/" << observability::FormatBytes(s.total_bytes);
  out << " db " << s.db_tables_done << "/" << s.db_tables_total << " tables " << observability::FormatBytes(s.db_bytes);
  return out.str();
}

} // namespace sitepull::transfer
