#include "memory_kv_store.hpp"

namespace sitepull::db::memory {

namespace {
constexpr std::size_t kPurgeEveryWrites = 256;
}

MemoryKeyValueStore::MemoryKeyValueStore(std::uint64_t max_value_bytes) : max_value_bytes_(max_value_bytes) {
}

bool MemoryKeyValueStore::IsExpired(const Slot& slot, Clock::time_point now) {
  return slot.expires_at <= now;
}

std::size_t MemoryKeyValueStore::PurgeLocked(Clock::time_point now) {
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (IsExpired(it->second, now)) {
      it = entries_.erase(it);
      ++removed;
      continue;
    }
    ++it;
  }
  writes_since_purge_ = 0;
  return removed;
}

Result MemoryKeyValueStore::Put(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) {
  return PutMany({{key, value}}, ttl);
}

Result MemoryKeyValueStore::PutMany(const std::vector<Entry>& entries, std::chrono::milliseconds ttl) {
  for (const auto& [key, value] : entries) {
    if (value.size() > max_value_bytes_) {
      return Result::Err(ErrorCode::ValueTooLarge, key + ": " + std::to_string(value.size()) + " bytes");
    }
  }

  std::lock_guard lock(mutex_);
  const auto      now = Clock::now();
  for (const auto& [key, value] : entries) {
    entries_[key] = Slot{value, now + ttl};
  }

  writes_since_purge_ += entries.size();
  if (writes_since_purge_ >= kPurgeEveryWrites) {
    PurgeLocked(now);
  }
  return Result::Ok();
}

std::optional<std::string> MemoryKeyValueStore::Get(const std::string& key) {
  std::lock_guard lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;
  if (IsExpired(it->second, Clock::now())) {
    entries_.erase(it);
    return std::nullopt;
  }
  return it->second.value;
}

Result MemoryKeyValueStore::Delete(const std::string& key) {
  std::lock_guard lock(mutex_);
  entries_.erase(key);
  return Result::Ok();
}

std::size_t MemoryKeyValueStore::PurgeExpired() {
  std::lock_guard lock(mutex_);
  return PurgeLocked(Clock::now());
}

} // namespace sitepull::db::memory
