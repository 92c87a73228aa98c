#pragma once

#include <memory>

#include "internal/db/api/table_source.hpp"
#include "pg_pool.hpp"

namespace sitepull::db::postgres {

/*
  TableSource over the current schema of a PostgreSQL database.

  Estimates come from pg_class (reltuples, total relation size). The CREATE
  statement is rebuilt from pg_attribute since PostgreSQL stores none.
*/
class PgTableSource final : public TableSource {
 public:
  explicit PgTableSource(std::shared_ptr<PgPool> pool);

  Dialect SqlDialect() const override {
    return Dialect::kPostgres;
  }

  std::vector<TableStats>  ListTables() override;
  TableDefinition          DescribeTable(const std::string& table) override;
  std::vector<std::string> PrimaryKeyColumns(const std::string& table) override;
  RowSet                   ReadByOffset(const std::string& table, std::uint64_t offset, std::uint32_t limit) override;
  RowSet                   ReadAfterKey(const std::string& table, const std::string& key_column, const std::optional<KeyValue>& after,
                                        std::uint32_t limit) override;

 private:
  std::shared_ptr<PgPool> pool_;
};

} // namespace sitepull::db::postgres
