#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/result.hpp"

namespace sitepull::db {

/*
  Key/value store with per-entry expiry.

  Values larger than MaxValueBytes() are refused with
  ErrorCode::ValueTooLarge. Expired entries are invisible to Get even
  before they are purged.
*/
class KeyValueStore {
 public:
  using Entry = std::pair<std::string, std::string>;

  virtual ~KeyValueStore() = default;

  virtual Result Put(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) = 0;

  // All or nothing.
  virtual Result PutMany(const std::vector<Entry>& entries, std::chrono::milliseconds ttl) = 0;

  virtual std::optional<std::string> Get(const std::string& key) = 0;

  virtual Result Delete(const std::string& key) = 0;

  // Drops expired entries, returns how many were removed.
  virtual std::size_t PurgeExpired() = 0;

  virtual std::uint64_t MaxValueBytes() const = 0;
};

} // namespace sitepull::db
