#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <unordered_map>

#include "service_context.hpp"
#include "sitepull/core/v1/jobs.pb.h"
#include "sitepull/services/v1/database_job_service.pb.h"

namespace sitepull::service {

/*
  Server-tracked database export.

  The job record (cursor and counters) lives in the job store; exported SQL
  is appended to <spool_dir>/<job_id>.sql. Before appending, the spool is
  cut back to the recorded byte count so a slice whose record update was
  lost is never written twice.
*/
class DatabaseJobService {
 public:
  // Returns false when the receiver went away.
  using ChunkSink = std::function<bool(std::string_view)>;

  explicit DatabaseJobService(ServiceContext ctx);

  sitepull::services::v1::InitDatabaseJobResponse InitJob(const sitepull::services::v1::InitDatabaseJobRequest& req);

  sitepull::services::v1::ProcessDatabaseJobResponse ProcessJob(const sitepull::services::v1::ProcessDatabaseJobRequest& req);

  void DownloadJob(const sitepull::services::v1::DownloadDatabaseJobRequest& req, const ChunkSink& sink);

  void FinishJob(const sitepull::services::v1::FinishDatabaseJobRequest& req);

  // Per-job locks currently tracked; idle ones are dropped on the next call.
  std::size_t TrackedJobLocks() const;

 private:
  sitepull::core::v1::DatabaseJobState LoadOrThrow(const std::string& job_id) const;
  std::shared_ptr<std::mutex>          JobLock(const std::string& job_id);

  ServiceContext ctx_;

  mutable std::mutex                                           locks_mutex_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> job_locks_;
};

} // namespace sitepull::service
