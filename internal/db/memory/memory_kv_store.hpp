#pragma once

#include <chrono>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/kv_store.hpp"

namespace sitepull::db::memory {

class MemoryKeyValueStore final : public KeyValueStore {
 public:
  explicit MemoryKeyValueStore(std::uint64_t max_value_bytes);

  Result                     Put(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) override;
  Result                     PutMany(const std::vector<Entry>& entries, std::chrono::milliseconds ttl) override;
  std::optional<std::string> Get(const std::string& key) override;
  Result                     Delete(const std::string& key) override;
  std::size_t                PurgeExpired() override;

  std::uint64_t MaxValueBytes() const override {
    return max_value_bytes_;
  }

 private:
  using Clock = std::chrono::steady_clock;

  struct Slot {
    std::string       value;
    Clock::time_point expires_at;
  };

  static bool IsExpired(const Slot& slot, Clock::time_point now);
  std::size_t PurgeLocked(Clock::time_point now);

  std::uint64_t max_value_bytes_;
  std::size_t   writes_since_purge_ = 0;

  std::mutex                            mutex_;
  std::unordered_map<std::string, Slot> entries_;
};

} // namespace sitepull::db::memory
