#pragma once

#include <map>
#include <mutex>

#include "internal/db/api/table_source.hpp"

namespace sitepull::db::memory {

/*
  In-memory TableSource. Tables are held in insertion (offset) order;
  keyset reads sort on the key column.
*/
class MemoryTableSource : public TableSource {
 public:
  struct Table {
    std::vector<std::string> columns;
    std::vector<std::string> primary_key;
    std::vector<Row>         rows;
    // Generated from the columns when empty.
    std::string create_statement;
  };

  explicit MemoryTableSource(Dialect dialect = Dialect::kSqlite);

  void PutTable(const std::string& name, Table table);

  Dialect SqlDialect() const override {
    return dialect_;
  }

  std::vector<TableStats>  ListTables() override;
  TableDefinition          DescribeTable(const std::string& table) override;
  std::vector<std::string> PrimaryKeyColumns(const std::string& table) override;
  RowSet                   ReadByOffset(const std::string& table, std::uint64_t offset, std::uint32_t limit) override;
  RowSet                   ReadAfterKey(const std::string& table, const std::string& key_column, const std::optional<KeyValue>& after,
                                        std::uint32_t limit) override;

 private:
  const Table& Find(const std::string& table) const;

  Dialect dialect_;

  mutable std::mutex           mutex_;
  std::map<std::string, Table> tables_;
};

} // namespace sitepull::db::memory
