#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include "sitepull/core/v1/types.pb.h"

namespace sitepull::manifest {

/*
  Recursive listing of the published tree.

  Regular readable files only; symlinks and VCS metadata directories
  (.git, .svn, .hg) are skipped. Paths are relative to `root`,
  '/'-separated, and the result is sorted by path.
*/
std::vector<sitepull::core::v1::ManifestEntry> ScanTree(const std::filesystem::path& root);

/*
  Maps a client supplied path onto a file below `root`.

  Throws util::ValidationError when the path is malformed or escapes the
  root after symlink resolution, util::NotFound when no regular file
  exists there.
*/
std::filesystem::path ResolveWithinRoot(const std::filesystem::path& root, std::string_view relative);

} // namespace sitepull::manifest
