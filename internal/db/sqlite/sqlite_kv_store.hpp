#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/kv_store.hpp"
#include "sqlite_db.hpp"

namespace sitepull::db::sqlite {

/*
  KeyValueStore persisted in a SQLite table:

    kv(key TEXT PRIMARY KEY, value BLOB, expires_at_ms INTEGER)

  Expiry is wall-clock based so entries survive a server restart with
  their remaining lifetime.
*/
class SqliteKeyValueStore final : public KeyValueStore {
 public:
  SqliteKeyValueStore(std::shared_ptr<SqliteDB> db, std::uint64_t max_value_bytes);

  static void BootstrapSchema(SqliteDB& db);

  Result                     Put(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) override;
  Result                     PutMany(const std::vector<Entry>& entries, std::chrono::milliseconds ttl) override;
  std::optional<std::string> Get(const std::string& key) override;
  Result                     Delete(const std::string& key) override;
  std::size_t                PurgeExpired() override;

  std::uint64_t MaxValueBytes() const override {
    return max_value_bytes_;
  }

 private:
  Result Translate(int rc) const;

  std::shared_ptr<SqliteDB> db_;
  std::uint64_t             max_value_bytes_;

  // one connection; serializes statements and transactions
  std::mutex mutex_;
};

} // namespace sitepull::db::sqlite
