#include "database_job_service.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include "internal/export/export_engine.hpp"
#include "internal/jobs/database_job_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"
#include "internal/util/time.hpp"

namespace sitepull::service {

namespace fs = std::filesystem;
namespace v1 = sitepull::services::v1;
using sitepull::core::v1::DatabaseJobState;
using observability::IntField;
using observability::StringField;

namespace {

void AppendToSpool(const fs::path& spool, std::uint64_t expected_size, const std::string& data) {
  std::error_code ec;
  const auto      actual = fs::file_size(spool, ec);
  if (ec) {
    throw util::StorageError("spool unavailable: " + spool.string() + ": " + ec.message());
  }
  if (actual != expected_size) {
    fs::resize_file(spool, expected_size, ec);
    if (ec) throw util::StorageError("spool rewind failed: " + ec.message());
  }

  std::ofstream out(spool, std::ios::binary | std::ios::app);
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  out.flush();
  if (!out) {
    throw util::StorageError("spool write failed: " + spool.string());
  }
}

} // namespace

DatabaseJobService::DatabaseJobService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::shared_ptr<std::mutex> DatabaseJobService::JobLock(const std::string& job_id) {
  std::lock_guard lock(locks_mutex_);

  // entries only the map still holds belong to no call in flight
  for (auto it = job_locks_.begin(); it != job_locks_.end();) {
    if (it->first != job_id && it->second.use_count() == 1) {
      it = job_locks_.erase(it);
    } else {
      ++it;
    }
  }

  auto& slot = job_locks_[job_id];
  if (!slot) slot = std::make_shared<std::mutex>();
  return slot;
}

std::size_t DatabaseJobService::TrackedJobLocks() const {
  std::lock_guard lock(locks_mutex_);
  return job_locks_.size();
}

DatabaseJobState DatabaseJobService::LoadOrThrow(const std::string& job_id) const {
  auto state = ctx_.database_jobs->Load(job_id);
  if (!state) {
    throw util::NotFound("database job not found: " + job_id);
  }
  return *state;
}

v1::InitDatabaseJobResponse DatabaseJobService::InitJob(const v1::InitDatabaseJobRequest& req) {
  auto init = ctx_.engine->Init(req.chunk_size() ? req.chunk_size() : ctx_.options.default_chunk_size);

  std::error_code ec;
  fs::create_directories(ctx_.options.spool_dir, ec);
  if (ec) {
    throw util::StorageError("cannot create spool dir " + ctx_.options.spool_dir.string() + ": " + ec.message());
  }

  DatabaseJobState state;
  state.set_job_id(util::GenerateJobId());
  state.set_created_at_ms(util::ToUnixMillis(util::Now()));
  state.set_spool_path((ctx_.options.spool_dir / (state.job_id() + ".sql")).string());
  state.set_total_tables(init.metadata.total_tables());
  state.set_total_rows(init.metadata.total_rows());

  {
    std::ofstream out(state.spool_path(), std::ios::binary | std::ios::trunc);
    out.write(init.preamble.data(), static_cast<std::streamsize>(init.preamble.size()));
    if (!out) throw util::StorageError("spool write failed: " + state.spool_path());
  }
  state.set_bytes_written(init.preamble.size());
  state.set_done(init.metadata.total_tables() == 0);
  state.set_cursor(std::move(init.cursor));
  ctx_.database_jobs->Save(state);

  SITEPULL_LOG_INFO("database job created", {StringField("job_id", state.job_id()), IntField("tables", state.total_tables()),
                    IntField("rows", static_cast<std::int64_t>(state.total_rows()))});

  v1::InitDatabaseJobResponse resp;
  resp.set_job_id(state.job_id());
  resp.set_total_tables(state.total_tables());
  resp.set_total_rows(state.total_rows());
  resp.set_bytes_written(state.bytes_written());
  return resp;
}

v1::ProcessDatabaseJobResponse DatabaseJobService::ProcessJob(const v1::ProcessDatabaseJobRequest& req) {
  auto            job_lock = JobLock(req.job_id());
  std::lock_guard guard(*job_lock);

  auto state = LoadOrThrow(req.job_id());
  if (!state.done()) {
    const auto budget   = req.has_time_budget_ms() ? std::chrono::milliseconds(req.time_budget_ms()) : ctx_.options.default_time_budget;
    const auto deadline = std::chrono::steady_clock::now() + budget;

    // keep stepping while budget remains; every step makes progress
    do {
      const auto remaining = std::max(std::chrono::milliseconds(0), std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()));
      auto       step      = ctx_.engine->Next(state.cursor(), remaining);

      AppendToSpool(state.spool_path(), state.bytes_written(), step.slice);
      state.set_bytes_written(state.bytes_written() + step.slice.size());
      state.set_completed_tables(step.progress.tables_completed());
      state.set_cursor(std::move(step.cursor));
      state.set_done(step.is_complete);
    } while (!state.done() && std::chrono::steady_clock::now() < deadline);

    ctx_.database_jobs->Save(state);
    if (state.done()) {
      SITEPULL_LOG_INFO("database job complete", {StringField("job_id", state.job_id()),
                        IntField("bytes", static_cast<std::int64_t>(state.bytes_written()))});
    }
  }

  v1::ProcessDatabaseJobResponse resp;
  resp.set_bytes_written(state.bytes_written());
  resp.set_completed_tables(state.completed_tables());
  resp.set_total_tables(state.total_tables());
  resp.set_done(state.done());
  return resp;
}

void DatabaseJobService::DownloadJob(const v1::DownloadDatabaseJobRequest& req, const ChunkSink& sink) {
  const auto state = LoadOrThrow(req.job_id());
  if (!state.done()) {
    throw util::InvalidState("database job not finished: " + req.job_id());
  }

  std::ifstream in(state.spool_path(), std::ios::binary);
  if (!in) {
    throw util::StorageError("spool missing for job " + req.job_id());
  }

  std::string   buffer(ctx_.options.stream_chunk_bytes, '\0');
  std::uint64_t remaining = state.bytes_written();
  while (remaining > 0) {
    const auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, buffer.size()));
    in.read(buffer.data(), want);
    if (in.gcount() != want) {
      throw util::StorageError("spool truncated for job " + req.job_id());
    }
    remaining -= static_cast<std::uint64_t>(want);
    if (!sink(std::string_view(buffer.data(), static_cast<std::size_t>(want)))) {
      SITEPULL_LOG_WARN("database download cancelled by client", {StringField("job_id", req.job_id())});
      return;
    }
  }
}

void DatabaseJobService::FinishJob(const v1::FinishDatabaseJobRequest& req) {
  auto            job_lock = JobLock(req.job_id());
  std::lock_guard guard(*job_lock);

  const auto      state = LoadOrThrow(req.job_id());
  std::error_code ec;
  fs::remove(state.spool_path(), ec);
  if (ec) {
    SITEPULL_LOG_WARN("spool removal failed", {StringField("job_id", req.job_id()), StringField("error", ec.message())});
  }
  ctx_.database_jobs->Delete(req.job_id());
  SITEPULL_LOG_INFO("database job finished", {StringField("job_id", req.job_id())});
}

} // namespace sitepull::service
