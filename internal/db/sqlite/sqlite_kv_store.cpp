#include "sqlite_kv_store.hpp"

#include "internal/util/time.hpp"
#include "sqlite_tx.hpp"

namespace sitepull::db::sqlite {

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

sqlite3_int64 NowMillis() {
  return static_cast<sqlite3_int64>(util::ToUnixMillis(util::Now()));
}

} // namespace

SqliteKeyValueStore::SqliteKeyValueStore(std::shared_ptr<SqliteDB> db, std::uint64_t max_value_bytes)
    : db_(std::move(db)), max_value_bytes_(max_value_bytes) {
}

void SqliteKeyValueStore::BootstrapSchema(SqliteDB& db) {
  db.Exec(R"SQL(
CREATE TABLE IF NOT EXISTS kv (
  key TEXT PRIMARY KEY,
  value BLOB NOT NULL,
  expires_at_ms INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS kv_expires_idx ON kv(expires_at_ms);
)SQL");
}

Result SqliteKeyValueStore::Translate(int rc) const {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db_->Handle()));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db_->Handle()));
    case SQLITE_TOOBIG:
      return Result::Err(ErrorCode::ValueTooLarge, sqlite3_errmsg(db_->Handle()));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db_->Handle()));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db_->Handle()));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db_->Handle()));
  }
}

Result SqliteKeyValueStore::Put(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) {
  return PutMany({{key, value}}, ttl);
}

Result SqliteKeyValueStore::PutMany(const std::vector<Entry>& entries, std::chrono::milliseconds ttl) {
  for (const auto& [key, value] : entries) {
    if (value.size() > max_value_bytes_) {
      return Result::Err(ErrorCode::ValueTooLarge, key + ": " + std::to_string(value.size()) + " bytes");
    }
  }

  std::lock_guard lock(mutex_);
  try {
    SqliteTransaction tx(db_);
    auto              st         = db_->Prepare("INSERT OR REPLACE INTO kv(key, value, expires_at_ms) VALUES(?, ?, ?);");
    const auto        expires_at = NowMillis() + static_cast<sqlite3_int64>(ttl.count());

    for (const auto& [key, value] : entries) {
      sqlite3_reset(st.get());
      BindText(st.get(), 1, key);
      BindBlob(st.get(), 2, value);
      sqlite3_bind_int64(st.get(), 3, expires_at);
      if (auto r = Translate(sqlite3_step(st.get())); !r) {
        return r;
      }
    }
    tx.Commit();
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
  return Result::Ok();
}

std::optional<std::string> SqliteKeyValueStore::Get(const std::string& key) {
  std::lock_guard lock(mutex_);

  auto st = db_->Prepare("SELECT value FROM kv WHERE key = ? AND expires_at_ms > ?;");
  BindText(st.get(), 1, key);
  sqlite3_bind_int64(st.get(), 2, NowMillis());

  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    return std::nullopt;
  }
  const auto* data = static_cast<const char*>(sqlite3_column_blob(st.get(), 0));
  const int   size = sqlite3_column_bytes(st.get(), 0);
  return data ? std::string(data, static_cast<std::size_t>(size)) : std::string();
}

Result SqliteKeyValueStore::Delete(const std::string& key) {
  std::lock_guard lock(mutex_);

  auto st = db_->Prepare("DELETE FROM kv WHERE key = ?;");
  BindText(st.get(), 1, key);
  return Translate(sqlite3_step(st.get()));
}

std::size_t SqliteKeyValueStore::PurgeExpired() {
  std::lock_guard lock(mutex_);

  auto st = db_->Prepare("DELETE FROM kv WHERE expires_at_ms <= ?;");
  sqlite3_bind_int64(st.get(), 1, NowMillis());
  if (sqlite3_step(st.get()) != SQLITE_DONE) {
    return 0;
  }
  return static_cast<std::size_t>(sqlite3_changes(db_->Handle()));
}

} // namespace sitepull::db::sqlite
