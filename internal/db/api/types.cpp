#include "internal/db/api/types.hpp"

namespace sitepull::db {

std::optional<KeyValue> ToKeyValue(const Value& value) {
  if (const auto* i = std::get_if<std::int64_t>(&value)) {
    return KeyValue{*i};
  }
  if (const auto* s = std::get_if<std::string>(&value)) {
    return KeyValue{*s};
  }
  return std::nullopt;
}

} // namespace sitepull::db
