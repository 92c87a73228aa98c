#include "internal/export/cursor_codec.hpp"

#include <absl/strings/escaping.h>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include "internal/export/cursor_limits.hpp"
#include "internal/util/errors.hpp"

namespace sitepull::exporter {

namespace v1 = sitepull::core::v1;
using sitepull::util::ProtocolError;

namespace {

[[noreturn]] void Reject(const std::string& why) {
  throw ProtocolError("invalid cursor: " + why);
}

} // namespace

std::string EncodeCursor(const v1::Cursor& cursor) {
  std::string bytes;
  {
    google::protobuf::io::StringOutputStream string_stream(&bytes);
    google::protobuf::io::CodedOutputStream  coded(&string_stream);
    coded.SetSerializationDeterministic(true);
    if (!cursor.SerializeToCodedStream(&coded)) {
      Reject("serialization failed");
    }
  }
  return absl::WebSafeBase64Escape(bytes);
}

v1::Cursor DecodeCursor(std::string_view token) {
  if (token.empty()) {
    Reject("empty token");
  }

  std::string bytes;
  if (!absl::WebSafeBase64Unescape(absl::string_view(token.data(), token.size()), &bytes)) {
    Reject("not url-safe base64");
  }

  v1::Cursor cursor;
  if (!cursor.ParseFromString(bytes)) {
    Reject("undecodable payload");
  }
  if (!cursor.GetReflection()->GetUnknownFields(cursor).empty()) {
    Reject("unknown fields");
  }

  ValidateCursor(cursor);
  return cursor;
}

void ValidateCursor(const v1::Cursor& cursor) {
  if (cursor.version() != kCursorVersion) {
    Reject("unsupported version " + std::to_string(cursor.version()));
  }
  if (cursor.session_id().empty()) {
    Reject("missing session id");
  }

  const auto table_count = static_cast<std::uint32_t>(cursor.tables_size());
  if (cursor.table_index() > table_count) {
    Reject("table index out of range");
  }
  if (cursor.is_complete() != (cursor.table_index() == table_count)) {
    Reject("completion flag disagrees with table index");
  }
  if (cursor.chunk_size() < kMinChunkRows || cursor.chunk_size() > kMaxChunkRows) {
    Reject("chunk size out of bounds");
  }
  if (static_cast<std::uint32_t>(cursor.per_table_info_size()) != table_count) {
    Reject("table info does not match table list");
  }
  for (const auto& table : cursor.tables()) {
    if (!cursor.per_table_info().contains(table)) {
      Reject("no table info for " + table);
    }
  }

  if (cursor.is_complete()) {
    if (!cursor.table_name().empty() || cursor.offset() != 0 || cursor.has_last_primary_key()) {
      Reject("position set on a complete cursor");
    }
    return;
  }

  if (cursor.table_name() != cursor.tables(static_cast<int>(cursor.table_index()))) {
    Reject("table name disagrees with table index");
  }
  if (cursor.has_last_primary_key() && cursor.last_primary_key().value_case() == v1::KeyValue::VALUE_NOT_SET) {
    Reject("empty primary key value");
  }

  const auto& info = cursor.per_table_info().at(cursor.table_name());
  switch (info.strategy()) {
    case v1::PAGINATION_STRATEGY_UNDECIDED:
      if (cursor.offset() != 0 || cursor.has_last_primary_key()) {
        Reject("position set before a strategy was chosen");
      }
      break;
    case v1::PAGINATION_STRATEGY_OFFSET:
      if (cursor.has_last_primary_key()) {
        Reject("primary key set on an offset-paged table");
      }
      break;
    case v1::PAGINATION_STRATEGY_KEYSET:
      if (cursor.offset() != 0 || !info.has_primary_key_column()) {
        Reject("keyset table without key column or with an offset");
      }
      break;
    default:
      Reject("unknown strategy");
  }
}

} // namespace sitepull::exporter
