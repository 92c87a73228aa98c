#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/kv_store.hpp"
#include "sitepull/core/v1/jobs.pb.h"

namespace sitepull::jobs {

// Database job records under db_job:<id>, refreshed with every save.
class DatabaseJobStore {
 public:
  DatabaseJobStore(std::shared_ptr<db::KeyValueStore> kv, std::chrono::milliseconds ttl);

  void Save(const sitepull::core::v1::DatabaseJobState& state);

  std::optional<sitepull::core::v1::DatabaseJobState> Load(const std::string& job_id) const;

  void Delete(const std::string& job_id);

 private:
  static std::string Key(const std::string& job_id);

  std::shared_ptr<db::KeyValueStore> kv_;
  std::chrono::milliseconds          ttl_;
};

} // namespace sitepull::jobs
