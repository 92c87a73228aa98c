#include "internal/util/paths.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace sitepull::util {

std::string NormalizeRelativePath(std::string_view path) {
  if (path.empty()) {
    throw ValidationError("empty path");
  }
  if (path.find('\0') != std::string_view::npos) {
    throw ValidationError("path contains NUL");
  }
  if (path.front() == '/' || path.find('\\') != std::string_view::npos) {
    throw ValidationError("path must be relative and '/'-separated: " + std::string(path));
  }

  std::string normalized;
  std::size_t start = 0;
  while (start <= path.size()) {
    auto end = path.find('/', start);
    if (end == std::string_view::npos) end = path.size();
    const auto segment = path.substr(start, end - start);
    start              = end + 1;

    if (segment.empty() || segment == ".") continue;
    if (segment == "..") {
      throw ValidationError("path escapes its root: " + std::string(path));
    }
    if (!normalized.empty()) normalized.push_back('/');
    normalized.append(segment);
  }

  if (normalized.empty()) {
    throw ValidationError("path names no file: " + std::string(path));
  }
  return normalized;
}

bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& path) {
  auto [root_end, path_it] = std::mismatch(root.begin(), root.end(), path.begin(), path.end());
  // a trailing separator on root shows up as an empty last element
  if (root_end != root.end() && !(std::next(root_end) == root.end() && root_end->empty())) {
    return false;
  }
  return path_it != path.end();
}

} // namespace sitepull::util
