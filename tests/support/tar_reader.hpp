#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <map>
#include <string>

#include "support/temp_dir.hpp"

namespace sitepull::testing {

// Member name -> content for every regular entry of a ustar archive.
inline std::map<std::string, std::string> ReadTar(const std::filesystem::path& archive) {
  const auto bytes = ReadFile(archive);

  std::map<std::string, std::string> members;
  std::size_t                        pos = 0;
  while (pos + 512 <= bytes.size()) {
    const char* header = bytes.data() + pos;
    if (header[0] == '\0') break;

    const std::string   name(header, strnlen(header, 100));
    const std::string   prefix(header + 345, strnlen(header + 345, 155));
    const std::uint64_t size = std::strtoull(std::string(header + 124, 11).c_str(), nullptr, 8);

    pos += 512;
    members[prefix.empty() ? name : prefix + "/" + name] = bytes.substr(pos, size);
    pos += (size + 511) / 512 * 512;
  }
  return members;
}

} // namespace sitepull::testing
