#include "pg_table_source.hpp"

#include "internal/util/errors.hpp"

namespace sitepull::db::postgres {

using sitepull::util::SourceError;

namespace {

// pg_type oids
constexpr pqxx::oid kBool    = 16;
constexpr pqxx::oid kBytea   = 17;
constexpr pqxx::oid kInt8    = 20;
constexpr pqxx::oid kInt2    = 21;
constexpr pqxx::oid kInt4    = 23;
constexpr pqxx::oid kFloat4  = 700;
constexpr pqxx::oid kFloat8  = 701;

Value FieldValue(const pqxx::field& field, pqxx::oid type) {
  if (field.is_null()) return std::monostate{};

  switch (type) {
    case kInt2:
    case kInt4:
    case kInt8:
      return field.as<std::int64_t>();
    case kFloat4:
    case kFloat8:
      return field.as<double>();
    case kBytea: {
      auto bytes = field.as<std::basic_string<std::byte>>();
      return Blob{std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size())};
    }
    case kBool:
      return std::string(field.as<bool>() ? "t" : "f");
    default:
      // numeric, dates, json and friends round-trip as quoted text
      return field.as<std::string>();
  }
}

RowSet ToRowSet(const pqxx::result& res) {
  RowSet out;
  const auto columns = res.columns();
  for (pqxx::row::size_type i = 0; i < columns; ++i) {
    out.columns.emplace_back(res.column_name(i));
  }
  for (const auto& row : res) {
    Row values;
    values.reserve(static_cast<std::size_t>(columns));
    for (pqxx::row::size_type i = 0; i < columns; ++i) {
      values.push_back(FieldValue(row[i], res.column_type(i)));
    }
    out.rows.push_back(std::move(values));
  }
  return out;
}

template <typename Fn>
auto Guard(const std::string& what, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const SourceError&) {
    throw;
  } catch (const std::exception& e) {
    throw SourceError(what + ": " + e.what());
  }
}

} // namespace

PgTableSource::PgTableSource(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::vector<TableStats> PgTableSource::ListTables() {
  return Guard("list tables", [&] {
    auto                  conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);

    auto res = tx.exec(
        "SELECT c.relname, GREATEST(c.reltuples, 0)::bigint, pg_total_relation_size(c.oid) "
        "FROM pg_class c JOIN pg_namespace n ON n.oid = c.relnamespace "
        "WHERE c.relkind = 'r' AND n.nspname = current_schema() "
        "ORDER BY c.relname");

    std::vector<TableStats> tables;
    for (const auto& row : res) {
      tables.push_back(TableStats{row[0].as<std::string>(), row[1].as<std::uint64_t>(), row[2].as<std::uint64_t>()});
    }
    return tables;
  });
}

TableDefinition PgTableSource::DescribeTable(const std::string& table) {
  return Guard("describe " + table, [&] {
    auto                   conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);

    auto res = tx.exec_params(
        "SELECT a.attname, format_type(a.atttypid, a.atttypmod), a.attnotnull, pg_get_expr(d.adbin, d.adrelid) "
        "FROM pg_attribute a LEFT JOIN pg_attrdef d ON d.adrelid = a.attrelid AND d.adnum = a.attnum "
        "WHERE a.attrelid = $1::regclass AND a.attnum > 0 AND NOT a.attisdropped "
        "ORDER BY a.attnum",
        tx.quote_name(table));
    if (res.empty()) {
      throw SourceError("unknown table: " + table);
    }

    TableDefinition def;
    def.name = table;
    std::string sql = "CREATE TABLE " + tx.quote_name(table) + " (\n";
    for (std::size_t i = 0; i < res.size(); ++i) {
      const auto& row = res[static_cast<pqxx::result::size_type>(i)];
      def.columns.push_back(row[0].as<std::string>());
      sql += "  " + tx.quote_name(row[0].as<std::string>()) + " " + row[1].as<std::string>();
      if (row[2].as<bool>()) sql += " NOT NULL";
      if (!row[3].is_null()) sql += " DEFAULT " + row[3].as<std::string>();
      sql += i + 1 < res.size() ? ",\n" : "";
    }

    auto pk = tx.exec_params("SELECT pg_get_constraintdef(oid) FROM pg_constraint WHERE conrelid = $1::regclass AND contype = 'p'",
                             tx.quote_name(table));
    if (!pk.empty()) {
      sql += ",\n  " + pk[0][0].as<std::string>();
    }
    def.create_statement = sql + "\n)";
    return def;
  });
}

std::vector<std::string> PgTableSource::PrimaryKeyColumns(const std::string& table) {
  return Guard("primary key of " + table, [&] {
    auto                   conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);

    auto res = tx.exec_params(
        "SELECT a.attname FROM pg_index i "
        "JOIN pg_attribute a ON a.attrelid = i.indrelid AND a.attnum = ANY(i.indkey) "
        "WHERE i.indrelid = $1::regclass AND i.indisprimary "
        "ORDER BY array_position(i.indkey, a.attnum)",
        tx.quote_name(table));

    std::vector<std::string> columns;
    for (const auto& row : res) columns.push_back(row[0].as<std::string>());
    return columns;
  });
}

RowSet PgTableSource::ReadByOffset(const std::string& table, std::uint64_t offset, std::uint32_t limit) {
  return Guard("read " + table, [&] {
    auto                   conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);
    return ToRowSet(tx.exec_params("SELECT * FROM " + tx.quote_name(table) + " LIMIT $1 OFFSET $2", limit, offset));
  });
}

RowSet PgTableSource::ReadAfterKey(const std::string& table, const std::string& key_column, const std::optional<KeyValue>& after,
                                   std::uint32_t limit) {
  return Guard("read " + table, [&] {
    auto                   conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);

    const auto from = "SELECT * FROM " + tx.quote_name(table);
    const auto key  = tx.quote_name(key_column);
    if (!after) {
      return ToRowSet(tx.exec_params(from + " ORDER BY " + key + " LIMIT $1", limit));
    }
    return std::visit(
        [&](const auto& last) { return ToRowSet(tx.exec_params(from + " WHERE " + key + " > $1 ORDER BY " + key + " LIMIT $2", last, limit)); },
        *after);
  });
}

} // namespace sitepull::db::postgres
