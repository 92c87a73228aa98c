#include "internal/export/sql_dump_writer.hpp"

#include <cmath>
#include <cstdio>

namespace sitepull::exporter {

namespace {

constexpr char kHex[] = "0123456789abcdef";

std::string HexEncode(const std::string& bytes) {
  std::string out;
  out.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    out.push_back(kHex[c >> 4]);
    out.push_back(kHex[c & 0x0F]);
  }
  return out;
}

std::string QuoteText(const std::string& text) {
  std::string out;
  out.reserve(text.size() + 2);
  out.push_back('\'');
  for (char c : text) {
    if (c == '\'') out.push_back('\'');
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

} // namespace

SqlDumpWriter::SqlDumpWriter(db::Dialect dialect) : dialect_(dialect) {
}

std::string SqlDumpWriter::QuoteIdentifier(std::string_view name) const {
  std::string out = "\"";
  for (char c : name) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string SqlDumpWriter::Literal(const db::Value& value) const {
  if (std::holds_alternative<std::monostate>(value)) {
    return "NULL";
  }
  if (const auto* i = std::get_if<std::int64_t>(&value)) {
    return std::to_string(*i);
  }
  if (const auto* d = std::get_if<double>(&value)) {
    if (std::isnan(*d)) {
      return dialect_ == db::Dialect::kPostgres ? "'NaN'" : "NULL";
    }
    if (std::isinf(*d)) {
      if (dialect_ == db::Dialect::kPostgres) return *d > 0 ? "'Infinity'" : "'-Infinity'";
      return *d > 0 ? "9e999" : "-9e999";
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.17g", *d);
    return buffer;
  }
  if (const auto* s = std::get_if<std::string>(&value)) {
    return QuoteText(*s);
  }

  const auto& blob = std::get<db::Blob>(value);
  if (dialect_ == db::Dialect::kPostgres) {
    return "'\\x" + HexEncode(blob.bytes) + "'::bytea";
  }
  return "X'" + HexEncode(blob.bytes) + "'";
}

std::string SqlDumpWriter::Header(util::TimePoint generated_at) const {
  std::string sql = "-- sitepull SQL export\n-- Generated: " + util::FormatIsoUtc(generated_at) + "\n\n";
  if (dialect_ == db::Dialect::kPostgres) {
    sql += "SET client_encoding = 'UTF8';\n";
    sql += "SET standard_conforming_strings = on;\n";
    sql += "BEGIN;\n";
  } else {
    sql += "PRAGMA foreign_keys=OFF;\n";
    sql += "BEGIN TRANSACTION;\n";
  }
  return sql;
}

std::string SqlDumpWriter::TableOpen(const db::TableDefinition& table) const {
  const auto name = QuoteIdentifier(table.name);

  std::string sql = "\n-- Table: " + table.name + "\n";
  if (dialect_ == db::Dialect::kPostgres) {
    sql += "DROP TABLE IF EXISTS " + name + " CASCADE;\n";
    sql += table.create_statement + ";\n\n";
    sql += "ALTER TABLE " + name + " DISABLE TRIGGER ALL;\n\n";
  } else {
    sql += "DROP TABLE IF EXISTS " + name + ";\n";
    sql += table.create_statement + ";\n\n";
  }
  return sql;
}

std::string SqlDumpWriter::TableClose(const std::string& table) const {
  if (dialect_ == db::Dialect::kPostgres) {
    return "\nALTER TABLE " + QuoteIdentifier(table) + " ENABLE TRIGGER ALL;\n\n";
  }
  return "\n";
}

std::string SqlDumpWriter::Trailer() const {
  std::string sql = "\n-- Export completed\n";
  if (dialect_ == db::Dialect::kPostgres) {
    sql += "COMMIT;\n";
  } else {
    sql += "COMMIT;\n";
    sql += "PRAGMA foreign_keys=ON;\n";
  }
  return sql;
}

std::string SqlDumpWriter::ColumnList(const std::vector<std::string>& columns) const {
  std::string list = "(";
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (i) list += ", ";
    list += QuoteIdentifier(columns[i]);
  }
  return list + ")";
}

std::string SqlDumpWriter::InsertRow(const std::string& table, const std::string& column_list, const db::Row& row) const {
  std::string sql = "INSERT INTO " + QuoteIdentifier(table) + " " + column_list + " VALUES (";
  for (std::size_t i = 0; i < row.size(); ++i) {
    if (i) sql += ", ";
    sql += Literal(row[i]);
  }
  return sql + ");\n";
}

} // namespace sitepull::exporter
