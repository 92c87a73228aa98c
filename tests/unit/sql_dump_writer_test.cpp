#include "internal/export/sql_dump_writer.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <string>

namespace {

using sitepull::db::Blob;
using sitepull::db::Dialect;
using sitepull::db::Row;
using sitepull::db::TableDefinition;
using sitepull::db::Value;
using sitepull::exporter::SqlDumpWriter;

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestLiteralsSqlite() {
  SqlDumpWriter writer(Dialect::kSqlite);

  assert(writer.Literal(Value{}) == "NULL");
  assert(writer.Literal(Value{std::int64_t{-42}}) == "-42");
  assert(writer.Literal(Value{std::string("it's")}) == "'it''s'");
  assert(writer.Literal(Value{std::string("")}) == "''");
  assert(writer.Literal(Value{Blob{std::string("\x00\xff\x10", 3)}}) == "X'00ff10'");
  assert(writer.Literal(Value{1.5}) == "1.5");
  assert(writer.Literal(Value{std::numeric_limits<double>::quiet_NaN()}) == "NULL");
  assert(writer.Literal(Value{std::numeric_limits<double>::infinity()}) == "9e999");
  assert(writer.Literal(Value{-std::numeric_limits<double>::infinity()}) == "-9e999");
}

void TestLiteralsPostgres() {
  SqlDumpWriter writer(Dialect::kPostgres);

  assert(writer.Literal(Value{Blob{"AB"}}) == "'\\x4142'::bytea");
  assert(writer.Literal(Value{std::numeric_limits<double>::quiet_NaN()}) == "'NaN'");
  assert(writer.Literal(Value{-std::numeric_limits<double>::infinity()}) == "'-Infinity'");
  assert(writer.Literal(Value{std::string("a'b")}) == "'a''b'");
}

void TestDoubleKeepsPrecision() {
  SqlDumpWriter writer(Dialect::kSqlite);
  const double  value = 0.1 + 0.2;
  assert(std::stod(writer.Literal(Value{value})) == value);
}

void TestIdentifiersAreQuoted() {
  SqlDumpWriter writer(Dialect::kSqlite);
  assert(writer.QuoteIdentifier("users") == "\"users\"");
  assert(writer.QuoteIdentifier("we\"ird") == "\"we\"\"ird\"");
  assert(writer.ColumnList({"id", "name"}) == "(\"id\", \"name\")");
}

void TestInsertRow() {
  SqlDumpWriter writer(Dialect::kSqlite);
  const auto    columns = writer.ColumnList({"id", "name", "avatar"});
  const Row     row{std::int64_t{7}, std::string("O'Neil"), Value{}};

  assert(writer.InsertRow("users", columns, row) ==
         "INSERT INTO \"users\" (\"id\", \"name\", \"avatar\") VALUES (7, 'O''Neil', NULL);\n");
}

void TestSqliteFraming() {
  SqlDumpWriter writer(Dialect::kSqlite);

  const auto header = writer.Header(sitepull::util::Now());
  assert(header.rfind("-- sitepull SQL export\n", 0) == 0);
  assert(Contains(header, "PRAGMA foreign_keys=OFF;\nBEGIN TRANSACTION;\n"));

  const auto open = writer.TableOpen(TableDefinition{"users", "CREATE TABLE users (id INTEGER PRIMARY KEY)", {"id"}});
  assert(open == "\n-- Table: users\nDROP TABLE IF EXISTS \"users\";\nCREATE TABLE users (id INTEGER PRIMARY KEY);\n\n");

  const auto trailer = writer.Trailer();
  assert(Contains(trailer, "COMMIT;\n"));
  assert(Contains(trailer, "PRAGMA foreign_keys=ON;\n"));
}

void TestPostgresFraming() {
  SqlDumpWriter writer(Dialect::kPostgres);

  const auto header = writer.Header(sitepull::util::Now());
  assert(Contains(header, "SET client_encoding = 'UTF8';"));
  assert(Contains(header, "BEGIN;\n"));

  const auto open = writer.TableOpen(TableDefinition{"posts", "CREATE TABLE posts (id bigint)", {"id"}});
  assert(Contains(open, "DROP TABLE IF EXISTS \"posts\" CASCADE;"));
  assert(Contains(open, "ALTER TABLE \"posts\" DISABLE TRIGGER ALL;"));
  assert(Contains(writer.TableClose("posts"), "ALTER TABLE \"posts\" ENABLE TRIGGER ALL;"));
  assert(!Contains(writer.Trailer(), "PRAGMA"));
}

} // namespace

int main() {
  TestLiteralsSqlite();
  TestLiteralsPostgres();
  TestDoubleKeepsPrecision();
  TestIdentifiersAreQuoted();
  TestInsertRow();
  TestSqliteFraming();
  TestPostgresFraming();

  std::cout << "sitepull_unit_sql_dump_writer: pass\n";
  return 0;
}
