#include "compression.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>

#include "internal/util/errors.hpp"

#if SITEPULL_WITH_ARROW
#include <arrow/result.h>
#include <arrow/util/compression.h>
#endif

namespace sitepull::util {
namespace v1 = sitepull::core::v1;

namespace {

#if SITEPULL_WITH_ARROW
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw StorageError("compression: " + result.status().ToString());
  return std::move(result).ValueUnsafe();
}

std::unique_ptr<arrow::util::Codec> MakeGzipCodec() {
  return Unwrap(arrow::util::Codec::Create(arrow::Compression::GZIP, kGzipLevel));
}

std::string GzipCompress(std::string_view data) {
  auto        codec   = MakeGzipCodec();
  const auto* input   = reinterpret_cast<const uint8_t*>(data.data());
  const auto  in_len  = static_cast<int64_t>(data.size());
  const auto  max_len = codec->MaxCompressedLen(in_len, input);

  std::string out(static_cast<std::size_t>(max_len), '\0');
  auto        written = Unwrap(codec->Compress(in_len, input, max_len, reinterpret_cast<uint8_t*>(out.data())));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

std::string GzipDecompress(std::string_view data) {
  auto codec        = MakeGzipCodec();
  auto decompressor = Unwrap(codec->MakeDecompressor());

  const auto* input     = reinterpret_cast<const uint8_t*>(data.data());
  int64_t     remaining = static_cast<int64_t>(data.size());

  std::string out;
  std::string buffer(64 * 1024, '\0');
  while (!decompressor->IsFinished()) {
    auto result = Unwrap(decompressor->Decompress(remaining, input, static_cast<int64_t>(buffer.size()), reinterpret_cast<uint8_t*>(buffer.data())));
    out.append(buffer.data(), static_cast<std::size_t>(result.bytes_written));
    input += result.bytes_read;
    remaining -= result.bytes_read;
    if (result.bytes_read == 0 && result.bytes_written == 0 && !result.need_more_output) {
      throw ValidationError("compression: truncated gzip stream");
    }
  }
  return out;
}
#endif

} // namespace

bool CompressionAvailable(v1::Compression compression) {
  switch (compression) {
    case v1::COMPRESSION_NONE:
      return true;
    case v1::COMPRESSION_GZIP:
      return SITEPULL_WITH_ARROW != 0;
    default:
      return false;
  }
}

v1::Compression ParseCompression(std::string_view name) {
  if (name.empty() || name == "none") return v1::COMPRESSION_NONE;
  if (name == "gzip") return v1::COMPRESSION_GZIP;
  throw ValidationError("unknown compression: " + std::string(name));
}

std::string Compress(std::string_view data, v1::Compression compression) {
  if (compression == v1::COMPRESSION_NONE) {
    return std::string(data);
  }
  if (!CompressionAvailable(compression)) {
    throw ValidationError("compression not available in this build");
  }
#if SITEPULL_WITH_ARROW
  return GzipCompress(data);
#else
  return std::string(data);
#endif
}

std::string Decompress(std::string_view data, v1::Compression compression) {
  if (compression == v1::COMPRESSION_NONE) {
    return std::string(data);
  }
  if (!CompressionAvailable(compression)) {
    throw ValidationError("compression not available in this build");
  }
#if SITEPULL_WITH_ARROW
  return GzipDecompress(data);
#else
  return std::string(data);
#endif
}

} // namespace sitepull::util
