#include "internal/export/export_engine.hpp"

#include <algorithm>

#include "internal/export/cursor_codec.hpp"
#include "internal/export/cursor_limits.hpp"
#include "internal/util/compression.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace sitepull::exporter {

namespace v1 = sitepull::core::v1;

namespace {

v1::KeyValue ToProto(const db::KeyValue& key) {
  v1::KeyValue out;
  if (const auto* i = std::get_if<std::int64_t>(&key)) {
    out.set_int_value(*i);
  } else {
    out.set_text_value(std::get<std::string>(key));
  }
  return out;
}

db::KeyValue FromProto(const v1::KeyValue& key) {
  if (key.value_case() == v1::KeyValue::kIntValue) {
    return key.int_value();
  }
  return key.text_value();
}

std::uint32_t AdaptChunkSize(std::uint32_t chunk, double elapsed_ms) {
  if (elapsed_ms < kFastStepMs && chunk < kMaxChunkRows) {
    return std::min(kMaxChunkRows, static_cast<std::uint32_t>(chunk * kGrowFactor));
  }
  if (elapsed_ms > kSlowStepMs && chunk > kMinChunkRows) {
    return std::max(kMinChunkRows, static_cast<std::uint32_t>(chunk * kShrinkFactor));
  }
  return chunk;
}

} // namespace

ExportEngine::ExportEngine(std::shared_ptr<db::TableSource> source, ClockFn clock)
    : source_(std::move(source)), writer_(source_->SqlDialect()), clock_(std::move(clock)) {
}

double ExportEngine::ElapsedMs(SteadyClock::time_point since) const {
  return std::chrono::duration<double, std::milli>(clock_() - since).count();
}

InitResult ExportEngine::Init(std::uint32_t chunk_size_hint) {
  const auto tables = source_->ListTables();

  v1::Cursor cursor;
  cursor.set_version(kCursorVersion);
  cursor.set_session_id(util::GenerateSessionId());
  cursor.set_chunk_size(ClampChunkSize(chunk_size_hint));

  InitResult result;
  auto&      metadata = result.metadata;
  for (const auto& table : tables) {
    cursor.add_tables(table.name);
    metadata.add_tables(table.name);
    metadata.set_total_rows(metadata.total_rows() + table.row_estimate);
    metadata.set_total_bytes(metadata.total_bytes() + table.byte_estimate);

    v1::TableInfo info;
    info.set_row_count_estimate(table.row_estimate);
    info.set_byte_size_estimate(table.byte_estimate);
    info.set_use_keyset(table.row_estimate > kKeysetThresholdRows || table.byte_estimate > kKeysetThresholdBytes);
    (*cursor.mutable_per_table_info())[table.name] = info;
  }
  metadata.set_total_tables(static_cast<std::uint32_t>(tables.size()));
  metadata.set_chunk_size(cursor.chunk_size());

  result.preamble = writer_.Header(util::Now());
  if (tables.empty()) {
    cursor.set_is_complete(true);
    result.preamble += writer_.Trailer();
  } else {
    cursor.set_table_name(cursor.tables(0));
  }

  result.cursor = EncodeCursor(cursor);
  return result;
}

void ExportEngine::DecideStrategy(const std::string& table, v1::TableInfo* info) {
  if (info->use_keyset()) {
    const auto keys = source_->PrimaryKeyColumns(table);
    if (keys.size() == 1) {
      info->set_primary_key_column(keys.front());
      info->set_strategy(v1::PAGINATION_STRATEGY_KEYSET);
      return;
    }
  }
  info->set_strategy(v1::PAGINATION_STRATEGY_OFFSET);
}

void ExportEngine::AdvanceTable(v1::Cursor* cursor) {
  cursor->set_table_index(cursor->table_index() + 1);
  cursor->set_offset(0);
  cursor->clear_last_primary_key();
  cursor->set_schema_sent(false);

  if (cursor->table_index() < static_cast<std::uint32_t>(cursor->tables_size())) {
    cursor->set_table_name(cursor->tables(static_cast<int>(cursor->table_index())));
    return;
  }
  cursor->clear_table_name();
  cursor->set_is_complete(true);
}

StepResult ExportEngine::Next(const std::string& cursor_token, std::chrono::milliseconds time_budget, v1::Compression compression) {
  const auto start = clock_();

  // decoded copy; the caller's token stays valid if anything below throws
  v1::Cursor cursor = DecodeCursor(cursor_token);
  if (!util::CompressionAvailable(compression)) {
    throw util::ValidationError("compression not available in this build");
  }

  StepResult result;
  auto&      progress = result.progress;
  progress.set_current_table(cursor.table_name());
  progress.set_current_table_index(cursor.table_index());

  auto finish = [&](const std::string& sql, double query_ms, std::uint32_t chunk_used) {
    progress.set_tables_completed(cursor.table_index());
    progress.set_bytes_in_chunk(sql.size());

    auto& perf = result.performance;
    perf.set_query_time_ms(query_ms);
    perf.set_compression(compression);
    perf.set_chunk_size_used(chunk_used);

    result.slice       = sql.empty() ? std::string() : util::Compress(sql, compression);
    result.is_complete = cursor.is_complete();
  };

  if (cursor.is_complete()) {
    finish({}, 0.0, cursor.chunk_size());
    result.cursor = EncodeCursor(cursor);
    result.performance.set_total_time_ms(ElapsedMs(start));
    return result;
  }

  const std::string table = cursor.table_name();
  auto&             info  = (*cursor.mutable_per_table_info())[table];

  std::string sql;
  if (!cursor.schema_sent()) {
    sql += writer_.TableOpen(source_->DescribeTable(table));
    cursor.set_schema_sent(true);
  }

  if (info.strategy() == v1::PAGINATION_STRATEGY_UNDECIDED) {
    DecideStrategy(table, &info);
  }
  const bool keyset = info.strategy() == v1::PAGINATION_STRATEGY_KEYSET;

  // one row past the chunk tells whether the table ends with it
  const std::uint32_t chunk       = cursor.chunk_size();
  const auto          query_start = clock_();
  db::RowSet          rows;
  if (keyset) {
    std::optional<db::KeyValue> after;
    if (cursor.has_last_primary_key()) after = FromProto(cursor.last_primary_key());
    rows = source_->ReadAfterKey(table, info.primary_key_column(), after, chunk + 1);
  } else {
    rows = source_->ReadByOffset(table, cursor.offset(), chunk + 1);
  }
  const double query_ms = ElapsedMs(query_start);

  std::size_t key_index = 0;
  if (keyset) {
    auto it = std::find(rows.columns.begin(), rows.columns.end(), info.primary_key_column());
    if (it == rows.columns.end() && !rows.rows.empty()) {
      throw util::SourceError("key column " + info.primary_key_column() + " missing from " + table);
    }
    key_index = static_cast<std::size_t>(it - rows.columns.begin());
  }

  const auto  column_list = writer_.ColumnList(rows.columns);
  std::size_t emitted     = 0;
  std::optional<db::KeyValue> last_key;
  for (const auto& row : rows.rows) {
    if (emitted == chunk) break;
    // the first row is always emitted so every call makes progress
    if (emitted > 0 && clock_() - start >= time_budget) {
      break;
    }
    if (keyset) {
      last_key = db::ToKeyValue(row[key_index]);
      if (!last_key) {
        throw util::SourceError("unsupported primary key value in " + table);
      }
    }
    sql += writer_.InsertRow(table, column_list, row);
    ++emitted;
  }

  if (keyset) {
    if (last_key) *cursor.mutable_last_primary_key() = ToProto(*last_key);
  } else {
    cursor.set_offset(cursor.offset() + emitted);
  }
  progress.set_rows_in_chunk(emitted);

  // a truncated page never finishes the table
  const bool exhausted = rows.rows.size() <= chunk && emitted == rows.rows.size();
  if (exhausted) {
    sql += writer_.TableClose(table);
    AdvanceTable(&cursor);
    if (cursor.is_complete()) {
      sql += writer_.Trailer();
    }
  }

  cursor.set_chunk_size(AdaptChunkSize(chunk, ElapsedMs(start)));
  finish(sql, query_ms, chunk);
  result.cursor = EncodeCursor(cursor);
  result.performance.set_total_time_ms(ElapsedMs(start));
  return result;
}

} // namespace sitepull::exporter
