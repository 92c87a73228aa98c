#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/types.hpp"
#include "internal/util/time.hpp"

namespace sitepull::exporter {

/*
  Dialect-aware SQL text for a streamed dump.

  Output order for one export:
    Header, then per table TableOpen, InsertRow..., TableClose, then Trailer.
*/
class SqlDumpWriter {
 public:
  explicit SqlDumpWriter(db::Dialect dialect);

  std::string Header(util::TimePoint generated_at) const;
  std::string TableOpen(const db::TableDefinition& table) const;
  std::string TableClose(const std::string& table) const;
  std::string Trailer() const;

  // "(\"a\", \"b\")" ready to be reused for every row of a page.
  std::string ColumnList(const std::vector<std::string>& columns) const;
  std::string InsertRow(const std::string& table, const std::string& column_list, const db::Row& row) const;

  std::string QuoteIdentifier(std::string_view name) const;
  std::string Literal(const db::Value& value) const;

 private:
  db::Dialect dialect_;
};

} // namespace sitepull::exporter
