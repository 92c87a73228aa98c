#pragma once

#include <memory>
#include <string>

#include "internal/db/api/table_source.hpp"
#include "sqlite_db.hpp"

namespace sitepull::db::sqlite {

/*
  TableSource over a SQLite database file.

  Row estimates come from COUNT(*); byte estimates from the dbstat virtual
  table when the library was built with it, zero otherwise.
*/
class SqliteTableSource final : public TableSource {
 public:
  explicit SqliteTableSource(std::shared_ptr<SqliteDB> db);

  Dialect SqlDialect() const override {
    return Dialect::kSqlite;
  }

  std::vector<TableStats>  ListTables() override;
  TableDefinition          DescribeTable(const std::string& table) override;
  std::vector<std::string> PrimaryKeyColumns(const std::string& table) override;
  RowSet                   ReadByOffset(const std::string& table, std::uint64_t offset, std::uint32_t limit) override;
  RowSet                   ReadAfterKey(const std::string& table, const std::string& key_column, const std::optional<KeyValue>& after,
                                        std::uint32_t limit) override;

 private:
  std::uint64_t EstimateBytes(const std::string& table);
  RowSet        Collect(sqlite3_stmt* stmt);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace sitepull::db::sqlite
