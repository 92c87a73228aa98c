#include "internal/jobs/expiry_worker.hpp"

#include "internal/observability/logging.hpp"

namespace sitepull::jobs {

namespace fs = std::filesystem;
using observability::IntField;
using observability::StringField;

ExpiryWorker::ExpiryWorker(std::shared_ptr<db::KeyValueStore> kv, fs::path spool_dir, std::chrono::milliseconds ttl,
                           std::chrono::milliseconds interval)
    : kv_(std::move(kv)), spool_dir_(std::move(spool_dir)), ttl_(ttl), interval_(interval) {
}

ExpiryWorker::~ExpiryWorker() {
  Stop();
}

void ExpiryWorker::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&ExpiryWorker::Run, this);
}

void ExpiryWorker::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void ExpiryWorker::SweepOnce() {
  const auto purged = kv_->PurgeExpired();

  std::size_t     removed = 0;
  std::error_code ec;
  if (fs::is_directory(spool_dir_, ec)) {
    const auto cutoff = fs::file_time_type::clock::now() - ttl_;
    for (const auto& entry : fs::directory_iterator(spool_dir_, ec)) {
      if (!entry.is_regular_file(ec) || entry.path().extension() != ".sql") continue;
      if (entry.last_write_time(ec) < cutoff && !ec && fs::remove(entry.path(), ec)) ++removed;
    }
  }

  if (purged > 0 || removed > 0) {
    SITEPULL_LOG_INFO("expired jobs swept", {IntField("entries", static_cast<std::int64_t>(purged)), IntField("spools", static_cast<std::int64_t>(removed))});
  }
}

void ExpiryWorker::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, interval_, [this] { return !running_; })) break;

    lock.unlock();
    try {
      SweepOnce();
    } catch (const std::exception& e) {
      SITEPULL_LOG_WARN("expiry sweep failed", {StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace sitepull::jobs
