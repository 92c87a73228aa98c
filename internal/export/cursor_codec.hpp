#pragma once

#include <string>
#include <string_view>

#include "sitepull/core/v1/cursor.pb.h"

namespace sitepull::exporter {

/*
  Cursor <-> token.

  A token is the deterministic protobuf encoding of the cursor in URL-safe
  base64 without padding, so Encode(Decode(t)) == t for every token this
  codec produced. Decode validates structure and throws util::ProtocolError.
*/
std::string EncodeCursor(const sitepull::core::v1::Cursor& cursor);

sitepull::core::v1::Cursor DecodeCursor(std::string_view token);

// Throws util::ProtocolError describing the first broken invariant.
void ValidateCursor(const sitepull::core::v1::Cursor& cursor);

} // namespace sitepull::exporter
