#include "memory_table_source.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace sitepull::db::memory {

using sitepull::util::SourceError;

namespace {

std::uint64_t ValueBytes(const Value& value) {
  if (const auto* s = std::get_if<std::string>(&value)) return s->size();
  if (const auto* b = std::get_if<Blob>(&value)) return b->bytes.size();
  return 8;
}

std::string GenerateCreate(const std::string& name, const MemoryTableSource::Table& table) {
  std::string sql = "CREATE TABLE \"" + name + "\" (";
  for (std::size_t i = 0; i < table.columns.size(); ++i) {
    if (i) sql += ", ";
    sql += "\"" + table.columns[i] + "\"";
  }
  if (!table.primary_key.empty()) {
    sql += ", PRIMARY KEY (";
    for (std::size_t i = 0; i < table.primary_key.size(); ++i) {
      if (i) sql += ", ";
      sql += "\"" + table.primary_key[i] + "\"";
    }
    sql += ")";
  }
  return sql + ")";
}

} // namespace

MemoryTableSource::MemoryTableSource(Dialect dialect) : dialect_(dialect) {
}

void MemoryTableSource::PutTable(const std::string& name, Table table) {
  if (table.create_statement.empty()) {
    table.create_statement = GenerateCreate(name, table);
  }
  std::lock_guard lock(mutex_);
  tables_[name] = std::move(table);
}

const MemoryTableSource::Table& MemoryTableSource::Find(const std::string& table) const {
  auto it = tables_.find(table);
  if (it == tables_.end()) {
    throw SourceError("unknown table: " + table);
  }
  return it->second;
}

std::vector<TableStats> MemoryTableSource::ListTables() {
  std::lock_guard lock(mutex_);

  std::vector<TableStats> stats;
  for (const auto& [name, table] : tables_) {
    TableStats s;
    s.name         = name;
    s.row_estimate = table.rows.size();
    for (const auto& row : table.rows) {
      for (const auto& value : row) s.byte_estimate += ValueBytes(value);
    }
    stats.push_back(std::move(s));
  }
  return stats;
}

TableDefinition MemoryTableSource::DescribeTable(const std::string& table) {
  std::lock_guard lock(mutex_);

  const auto& t = Find(table);
  return TableDefinition{table, t.create_statement, t.columns};
}

std::vector<std::string> MemoryTableSource::PrimaryKeyColumns(const std::string& table) {
  std::lock_guard lock(mutex_);
  return Find(table).primary_key;
}

RowSet MemoryTableSource::ReadByOffset(const std::string& table, std::uint64_t offset, std::uint32_t limit) {
  std::lock_guard lock(mutex_);

  const auto& t = Find(table);
  RowSet      out;
  out.columns = t.columns;
  for (std::uint64_t i = offset; i < t.rows.size() && out.rows.size() < limit; ++i) {
    out.rows.push_back(t.rows[i]);
  }
  return out;
}

RowSet MemoryTableSource::ReadAfterKey(const std::string& table, const std::string& key_column, const std::optional<KeyValue>& after,
                                       std::uint32_t limit) {
  std::lock_guard lock(mutex_);

  const auto& t   = Find(table);
  auto        pos = std::find(t.columns.begin(), t.columns.end(), key_column);
  if (pos == t.columns.end()) {
    throw SourceError("unknown column " + key_column + " in " + table);
  }
  const auto index = static_cast<std::size_t>(pos - t.columns.begin());

  std::vector<std::pair<KeyValue, const Row*>> keyed;
  for (const auto& row : t.rows) {
    auto key = ToKeyValue(row[index]);
    if (!key) continue;
    if (after && !(*after < *key)) continue;
    keyed.emplace_back(std::move(*key), &row);
  }
  std::sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

  RowSet out;
  out.columns = t.columns;
  for (const auto& [key, row] : keyed) {
    if (out.rows.size() >= limit) break;
    out.rows.push_back(*row);
  }
  return out;
}

} // namespace sitepull::db::memory
