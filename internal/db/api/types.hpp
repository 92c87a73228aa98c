#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sitepull::db {

struct Blob {
  std::string bytes;

  bool operator==(const Blob&) const = default;
};

// NULL, integer, real, text, blob.
using Value = std::variant<std::monostate, std::int64_t, double, std::string, Blob>;
using Row   = std::vector<Value>;

// Keyset pagination only ever remembers integer or text keys.
using KeyValue = std::variant<std::int64_t, std::string>;

struct RowSet {
  std::vector<std::string> columns;
  std::vector<Row>         rows;
};

struct TableStats {
  std::string   name;
  std::uint64_t row_estimate  = 0;
  std::uint64_t byte_estimate = 0;
};

struct TableDefinition {
  std::string              name;
  std::string              create_statement;
  std::vector<std::string> columns;
};

enum class Dialect {
  kSqlite,
  kPostgres,
};

// Converts the key column of a row; blobs, reals and NULLs are rejected.
std::optional<KeyValue> ToKeyValue(const Value& value);

} // namespace sitepull::db
