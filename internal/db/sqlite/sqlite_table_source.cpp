#include "sqlite_table_source.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace sitepull::db::sqlite {

using sitepull::util::SourceError;

namespace {

std::string QuoteIdent(const std::string& name) {
  std::string out = "\"";
  for (char c : name) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col))) : "";
}

Value ColValue(sqlite3_stmt* st, int col) {
  switch (sqlite3_column_type(st, col)) {
    case SQLITE_INTEGER:
      return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
    case SQLITE_FLOAT:
      return sqlite3_column_double(st, col);
    case SQLITE_TEXT:
      return ColText(st, col);
    case SQLITE_BLOB: {
      const auto* data = static_cast<const char*>(sqlite3_column_blob(st, col));
      const int   size = sqlite3_column_bytes(st, col);
      return Blob{data ? std::string(data, static_cast<std::size_t>(size)) : std::string()};
    }
    default:
      return std::monostate{};
  }
}

// Runs `fn`, turning backend failures into SourceError.
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

SqliteTableSource::SqliteTableSource(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::vector<TableStats> SqliteTableSource::ListTables() {
  return Guard("list tables", [&] {
    std::vector<std::string> names;
    {
      auto st = db_->Prepare("SELECT name FROM sqlite_master WHERE type='table' AND name NOT LIKE 'sqlite_%' ORDER BY name;");
      int  rc = SQLITE_OK;
      while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        names.push_back(ColText(st.get(), 0));
      }
      if (rc != SQLITE_DONE) throw SourceError(std::string("list tables: ") + sqlite3_errmsg(db_->Handle()));
    }

    std::vector<TableStats> tables;
    tables.reserve(names.size());
    for (auto& name : names) {
      TableStats stats;
      auto       st = db_->Prepare("SELECT COUNT(*) FROM " + QuoteIdent(name) + ";");
      if (sqlite3_step(st.get()) != SQLITE_ROW) {
        throw SourceError("count rows of " + name + ": " + sqlite3_errmsg(db_->Handle()));
      }
      stats.row_estimate  = static_cast<std::uint64_t>(sqlite3_column_int64(st.get(), 0));
      stats.byte_estimate = EstimateBytes(name);
      stats.name          = std::move(name);
      tables.push_back(std::move(stats));
    }
    return tables;
  });
}

std::uint64_t SqliteTableSource::EstimateBytes(const std::string& table) {
  Statement st;
  try {
    st = db_->Prepare("SELECT COALESCE(SUM(pgsize), 0) FROM dbstat WHERE name = ?;");
  } catch (const std::runtime_error&) {
    // library built without SQLITE_ENABLE_DBSTAT_VTAB
    return 0;
  }
  BindText(st.get(), 1, table);
  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    return 0;
  }
  return static_cast<std::uint64_t>(sqlite3_column_int64(st.get(), 0));
}

TableDefinition SqliteTableSource::DescribeTable(const std::string& table) {
  return Guard("describe " + table, [&] {
    TableDefinition def;
    def.name = table;

    auto st = db_->Prepare("SELECT sql FROM sqlite_master WHERE type='table' AND name = ?;");
    BindText(st.get(), 1, table);
    if (sqlite3_step(st.get()) != SQLITE_ROW) {
      throw SourceError("unknown table: " + table);
    }
    def.create_statement = ColText(st.get(), 0);

    auto info = db_->Prepare("PRAGMA table_info(" + QuoteIdent(table) + ");");
    while (sqlite3_step(info.get()) == SQLITE_ROW) {
      def.columns.push_back(ColText(info.get(), 1));
    }
    return def;
  });
}

std::vector<std::string> SqliteTableSource::PrimaryKeyColumns(const std::string& table) {
  return Guard("primary key of " + table, [&] {
    // pk holds the 1-based position inside the key, 0 for other columns
    std::vector<std::pair<int, std::string>> keyed;
    auto                                     st = db_->Prepare("PRAGMA table_info(" + QuoteIdent(table) + ");");
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
      const int pk = sqlite3_column_int(st.get(), 5);
      if (pk > 0) keyed.emplace_back(pk, ColText(st.get(), 1));
    }
    std::sort(keyed.begin(), keyed.end());

    std::vector<std::string> columns;
    for (auto& [pos, name] : keyed) columns.push_back(std::move(name));
    return columns;
  });
}

RowSet SqliteTableSource::Collect(sqlite3_stmt* stmt) {
  RowSet    rows;
  const int count = sqlite3_column_count(stmt);
  for (int i = 0; i < count; ++i) {
    rows.columns.emplace_back(sqlite3_column_name(stmt, i));
  }

  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    Row row;
    row.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
      row.push_back(ColValue(stmt, i));
    }
    rows.rows.push_back(std::move(row));
  }
  if (rc != SQLITE_DONE) {
    throw SourceError(std::string("read rows: ") + sqlite3_errmsg(db_->Handle()));
  }
  return rows;
}

RowSet SqliteTableSource::ReadByOffset(const std::string& table, std::uint64_t offset, std::uint32_t limit) {
  return Guard("read " + table, [&] {
    auto st = db_->Prepare("SELECT * FROM " + QuoteIdent(table) + " LIMIT ? OFFSET ?;");
    sqlite3_bind_int64(st.get(), 1, static_cast<sqlite3_int64>(limit));
    sqlite3_bind_int64(st.get(), 2, static_cast<sqlite3_int64>(offset));
    return Collect(st.get());
  });
}

RowSet SqliteTableSource::ReadAfterKey(const std::string& table, const std::string& key_column, const std::optional<KeyValue>& after,
                                       std::uint32_t limit) {
  return Guard("read " + table, [&] {
    const auto key = QuoteIdent(key_column);
    if (!after) {
      auto st = db_->Prepare("SELECT * FROM " + QuoteIdent(table) + " ORDER BY " + key + " LIMIT ?;");
      sqlite3_bind_int64(st.get(), 1, static_cast<sqlite3_int64>(limit));
      return Collect(st.get());
    }

    auto st = db_->Prepare("SELECT * FROM " + QuoteIdent(table) + " WHERE " + key + " > ? ORDER BY " + key + " LIMIT ?;");
    if (const auto* i = std::get_if<std::int64_t>(&*after)) {
      sqlite3_bind_int64(st.get(), 1, static_cast<sqlite3_int64>(*i));
    } else {
      BindText(st.get(), 1, std::get<std::string>(*after));
    }
    sqlite3_bind_int64(st.get(), 2, static_cast<sqlite3_int64>(limit));
    return Collect(st.get());
  });
}

} // namespace sitepull::db::sqlite
