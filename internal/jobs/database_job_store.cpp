#include "internal/jobs/database_job_store.hpp"

#include "internal/util/errors.hpp"

namespace sitepull::jobs {

DatabaseJobStore::DatabaseJobStore(std::shared_ptr<db::KeyValueStore> kv, std::chrono::milliseconds ttl) : kv_(std::move(kv)), ttl_(ttl) {
}

std::string DatabaseJobStore::Key(const std::string& job_id) {
  return "db_job:" + job_id;
}

void DatabaseJobStore::Save(const sitepull::core::v1::DatabaseJobState& state) {
  if (auto r = kv_->Put(Key(state.job_id()), state.SerializeAsString(), ttl_); !r) {
    throw util::StorageError("saving database job " + state.job_id() + " failed: " + r.message);
  }
}

std::optional<sitepull::core::v1::DatabaseJobState> DatabaseJobStore::Load(const std::string& job_id) const {
  auto raw = kv_->Get(Key(job_id));
  if (!raw) return std::nullopt;

  sitepull::core::v1::DatabaseJobState state;
  if (!state.ParseFromString(*raw)) {
    throw util::StorageError("corrupt database job record " + job_id);
  }
  return state;
}

void DatabaseJobStore::Delete(const std::string& job_id) {
  if (auto r = kv_->Delete(Key(job_id)); !r) {
    throw util::StorageError("deleting database job " + job_id + " failed: " + r.message);
  }
}

} // namespace sitepull::jobs
