#include <cassert>
#include <exception>
#include <iostream>
#include <string>

#include "internal/util/compression.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace v1 = sitepull::core::v1;
using sitepull::util::Compress;
using sitepull::util::Decompress;

void TestParseCompression() {
  assert(sitepull::util::ParseCompression("") == v1::COMPRESSION_NONE);
  assert(sitepull::util::ParseCompression("none") == v1::COMPRESSION_NONE);
  assert(sitepull::util::ParseCompression("gzip") == v1::COMPRESSION_GZIP);

  bool rejected = false;
  try {
    (void)sitepull::util::ParseCompression("zstd");
  } catch (const sitepull::util::ValidationError&) {
    rejected = true;
  }
  assert(rejected);
}

void TestGzipRoundTrip() {
  assert(sitepull::util::CompressionAvailable(v1::COMPRESSION_NONE));
  assert(sitepull::util::CompressionAvailable(v1::COMPRESSION_GZIP));

  std::string sql;
  for (int i = 0; i < 500; ++i) {
    sql += "INSERT INTO \"posts\" VALUES (" + std::to_string(i) + ", 'hello world');\n";
  }

  const auto packed = Compress(sql, v1::COMPRESSION_GZIP);
  assert(packed.size() < sql.size());
  assert(static_cast<unsigned char>(packed[0]) == 0x1f);
  assert(static_cast<unsigned char>(packed[1]) == 0x8b);
  assert(Decompress(packed, v1::COMPRESSION_GZIP) == sql);

  assert(Decompress(Compress("", v1::COMPRESSION_GZIP), v1::COMPRESSION_GZIP).empty());
  assert(Compress(sql, v1::COMPRESSION_NONE) == sql);
}

void TestTruncatedStreamFails() {
  const auto packed = Compress(std::string(4096, 'a'), v1::COMPRESSION_GZIP);

  bool failed = false;
  try {
    (void)Decompress(packed.substr(0, packed.size() / 2), v1::COMPRESSION_GZIP);
  } catch (const std::exception&) {
    failed = true;
  }
  assert(failed);
}

} // namespace

int main() {
  TestParseCompression();
  TestGzipRoundTrip();
  TestTruncatedStreamFails();

  std::cout << "sitepull_unit_compression: pass\n";
  return 0;
}
