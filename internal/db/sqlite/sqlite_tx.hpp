#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace sitepull::db::sqlite {

/*
  SQLite transaction guard.

  Uses BEGIN IMMEDIATE to grab the write lock up front. Rolls back on
  destruction unless committed.
*/
class SqliteTransaction final {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit();
  void Rollback();
  bool IsFinished() const {
    return finished_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      finished_ = false;
};

} // namespace sitepull::db::sqlite
