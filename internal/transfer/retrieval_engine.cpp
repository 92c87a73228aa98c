#include "retrieval_engine.hpp"

#include <algorithm>
#include <optional>
#include <thread>

#include "file_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/paths.hpp"
#include "work_queue.hpp"

namespace sitepull::transfer {

namespace fs = std::filesystem;
using observability::IntField;
using observability::StringField;

std::vector<RetrievalUnit> BuildUnits(const manifest::Partition& partition) {
  std::vector<RetrievalUnit> units;
  units.reserve(partition.large.size() + partition.batches.size());

  for (const auto& file : partition.large) {
    units.push_back(RetrievalUnit{RetrievalUnit::Kind::kLargeFile, {file}, file.size});
  }
  for (const auto& batch : partition.batches) {
    units.push_back(RetrievalUnit{RetrievalUnit::Kind::kBatch, batch.files, batch.total_bytes});
  }
  return units;
}

RetrievalEngine::RetrievalEngine(std::shared_ptr<Transport> transport, RetrievalOptions options, ProgressAggregator* progress)
    : transport_(std::move(transport)), options_(options), progress_(progress) {
  if (options_.max_attempts == 0) options_.max_attempts = 1;
}

TransferResult RetrievalEngine::Retrieve(const std::vector<RetrievalUnit>& units, const fs::path& destination_root,
                                         const ProgressFn& on_progress) {
  TransferResult total;
  if (units.empty()) return total;

  const auto workers = static_cast<std::size_t>(std::clamp<std::uint64_t>(options_.concurrency, 1, units.size()));

  WorkQueue<const RetrievalUnit*> work;
  WorkQueue<TransferResult>       results;

  for (const auto& unit : units) work.Push(&unit);
  work.Close();

  std::vector<std::thread> pool;
  pool.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    pool.emplace_back([&] {
      while (auto unit = work.Pop()) {
        results.Push(RunUnit(**unit, destination_root, on_progress));
      }
    });
  }

  // collector: one message per unit
  for (std::size_t received = 0; received < units.size(); ++received) {
    auto outcome = results.Pop();
    if (!outcome) break;

    total += *outcome;
    if (progress_) {
      progress_->AddFilesCompleted(outcome->files_succeeded);
      progress_->AddFilesFailed(outcome->files_failed);
    }
  }

  for (auto& t : pool) t.join();

  SITEPULL_LOG_INFO("retrieval finished", {IntField("units", static_cast<std::int64_t>(units.size())),
                                           IntField("workers", static_cast<std::int64_t>(workers)),
                                           IntField("files_ok", static_cast<std::int64_t>(total.files_succeeded)),
                                           IntField("files_failed", static_cast<std::int64_t>(total.files_failed)),
                                           StringField("bytes", observability::FormatBytes(total.bytes_transferred))});
  return total;
}

TransferResult RetrievalEngine::RunUnit(const RetrievalUnit& unit, const fs::path& root, const ProgressFn& on_progress) {
  TransferResult result;
  auto           pending = unit.files;

  auto fail_pending = [&](const std::string& reason) {
    result.files_failed += pending.size();
    SITEPULL_LOG_WARN("retrieval unit failed", {IntField("files", static_cast<std::int64_t>(pending.size())),
                                                StringField("first_path", pending.empty() ? std::string() : pending.front().path),
                                                StringField("error", reason)});
    pending.clear();
  };

  try {
    for (const auto& file : pending) util::NormalizeRelativePath(file.path);
  } catch (const util::ValidationError& e) {
    fail_pending(e.what());
  }

  for (std::uint32_t attempt = 1; !pending.empty(); ++attempt) {
    try {
      if (unit.kind == RetrievalUnit::Kind::kLargeFile) {
        FetchLarge(pending.front(), root, on_progress, &result);
        pending.clear();
      } else {
        FetchBatch(&pending, root, on_progress, &result);
      }
    } catch (const util::TransportError& e) {
      if (!e.Retryable() || attempt >= options_.max_attempts) {
        fail_pending(e.what());
        break;
      }
      SITEPULL_LOG_WARN("retrying unit", {IntField("attempt", attempt), IntField("remaining", static_cast<std::int64_t>(pending.size())),
                                          StringField("error", e.what())});
      std::this_thread::sleep_for(options_.retry_backoff * attempt);
    } catch (const std::exception& e) {
      // storage, validation and protocol failures are not retried
      fail_pending(e.what());
    }
  }

  if (result.files_failed == 0) {
    result.units_succeeded = 1;
  } else {
    result.units_failed = 1;
  }
  return result;
}

void RetrievalEngine::FetchLarge(const manifest::FileDescriptor& file, const fs::path& root, const ProgressFn& on_progress,
                                 TransferResult* result) {
  FileSink sink(root, file.path);
  transport_->FetchFile(file.path, [&](std::string_view data) { sink.Write(data); });
  sink.Commit();
  if (on_progress) on_progress(sink.BytesWritten());

  result->files_succeeded += 1;
  result->bytes_transferred += sink.BytesWritten();
}

void RetrievalEngine::FetchBatch(std::vector<manifest::FileDescriptor>* pending, const fs::path& root, const ProgressFn& on_progress,
                                 TransferResult* result) {
  std::vector<std::string> paths;
  paths.reserve(pending->size());
  for (const auto& file : *pending) paths.push_back(file.path);

  // frames arrive in request order, one file at a time
  std::size_t             next = 0;
  std::optional<FileSink> current;

  auto on_frame = [&](const std::string& path, std::string_view data, bool last, const std::string& error) {
    if (!current) {
      if (next >= paths.size() || path != paths[next]) {
        throw util::ProtocolError("unexpected batch frame for " + path);
      }
      if (!error.empty()) {
        if (!last) throw util::ProtocolError("error frame without last flag for " + path);
        SITEPULL_LOG_WARN("remote file unavailable", {StringField("path", path), StringField("error", error)});
        result->files_failed += 1;
        ++next;
        return;
      }
      current.emplace(root, path);
    } else if (path != paths[next]) {
      throw util::ProtocolError("interleaved batch frame for " + path);
    }

    current->Write(data);

    if (!error.empty()) {
      SITEPULL_LOG_WARN("remote file failed mid-stream", {StringField("path", path), StringField("error", error)});
      current.reset();
      result->files_failed += 1;
      ++next;
      return;
    }

    if (last) {
      current->Commit();
      if (on_progress) on_progress(current->BytesWritten());
      result->files_succeeded += 1;
      result->bytes_transferred += current->BytesWritten();
      current.reset();
      ++next;
    }
  };

  // anything not settled is fetched again on the next attempt
  auto settle = [&] { pending->erase(pending->begin(), pending->begin() + static_cast<std::ptrdiff_t>(next)); };

  try {
    transport_->FetchBatch(paths, on_frame);
  } catch (const std::exception&) {
    current.reset();
    settle();
    throw;
  }
  settle();

  if (!pending->empty()) {
    throw util::TransportError("batch stream ended before " + pending->front().path);
  }
}

} // namespace sitepull::transfer
