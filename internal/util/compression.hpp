#pragma once

#include <string>
#include <string_view>

#include "sitepull/core/v1/types.pb.h"

namespace sitepull::util {

/*
  Slice compression.

  Gzip goes through Arrow's codec layer. Builds without Arrow reject any
  request other than COMPRESSION_NONE with ValidationError.
*/

inline constexpr int kGzipLevel = 6;

bool CompressionAvailable(sitepull::core::v1::Compression compression);

// Parses "none" / "gzip" (empty means none).
sitepull::core::v1::Compression ParseCompression(std::string_view name);

std::string Compress(std::string_view data, sitepull::core::v1::Compression compression);
std::string Decompress(std::string_view data, sitepull::core::v1::Compression compression);

} // namespace sitepull::util
