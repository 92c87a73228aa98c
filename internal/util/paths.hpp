#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace sitepull::util {

/*
  Normalizes a manifest path: '/'-separated, relative, no "." or ".."
  segments, no empty segments, no NUL. Throws ValidationError otherwise.
*/
std::string NormalizeRelativePath(std::string_view path);

// True when `path` (canonical) lies inside `root` (canonical).
bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& path);

} // namespace sitepull::util
