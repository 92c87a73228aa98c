#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/db/api/kv_store.hpp"

namespace sitepull::jobs {

/*
  Background sweeper for abandoned jobs.

  Every interval it purges expired key/value entries and deletes spool
  files older than the job TTL, so a client that never calls FinishJob
  leaves nothing behind for long.
*/
class ExpiryWorker {
 public:
  ExpiryWorker(std::shared_ptr<db::KeyValueStore> kv, std::filesystem::path spool_dir, std::chrono::milliseconds ttl,
               std::chrono::milliseconds interval);
  ~ExpiryWorker();

  void Start();
  void Stop();

  // One sweep on the calling thread.
  void SweepOnce();

 private:
  void Run();

  std::shared_ptr<db::KeyValueStore> kv_;
  std::filesystem::path              spool_dir_;
  std::chrono::milliseconds          ttl_;
  std::chrono::milliseconds          interval_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
};

} // namespace sitepull::jobs
