#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace sitepull::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Thin RAII wrapper around sqlite3*.

  Read-only handles are used for exported databases and never touch the
  journal mode of a file that belongs to someone else.
*/
class SqliteDB {
 public:
  enum class OpenMode { kReadWrite, kReadOnly };

  explicit SqliteDB(std::string path, OpenMode mode = OpenMode::kReadWrite);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  OpenMode    mode_;
};

} // namespace sitepull::db::sqlite
