#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/types.hpp"

namespace sitepull::db {

/*
  Opaque table-and-row provider exported by the pagination engine.

  Implementations throw util::SourceError for every backend failure.
  Calls from different gRPC handler threads may overlap; implementations
  synchronize internally.
*/
class TableSource {
 public:
  virtual ~TableSource() = default;

  virtual Dialect SqlDialect() const = 0;

  // Ordered by name. Estimates only steer the pagination strategy.
  virtual std::vector<TableStats> ListTables() = 0;

  virtual TableDefinition DescribeTable(const std::string& table) = 0;

  virtual std::vector<std::string> PrimaryKeyColumns(const std::string& table) = 0;

  virtual RowSet ReadByOffset(const std::string& table, std::uint64_t offset, std::uint32_t limit) = 0;

  // Rows with key_column > after (all rows when `after` is empty), ascending.
  virtual RowSet ReadAfterKey(const std::string& table, const std::string& key_column, const std::optional<KeyValue>& after,
                              std::uint32_t limit) = 0;
};

} // namespace sitepull::db
