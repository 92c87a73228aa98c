#include "internal/manifest/scanner.hpp"

#include <unistd.h>

#include <algorithm>
#include <array>
#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/paths.hpp"

namespace sitepull::manifest {

namespace fs = std::filesystem;
namespace v1 = sitepull::core::v1;

namespace {

constexpr std::array<std::string_view, 3> kSkippedDirs = {".git", ".svn", ".hg"};

bool IsSkippedDir(const fs::path& path) {
  const auto name = path.filename().string();
  return std::find(kSkippedDirs.begin(), kSkippedDirs.end(), name) != kSkippedDirs.end();
}

std::int64_t ToUnixSeconds(fs::file_time_type time) {
  const auto sys = std::chrono::file_clock::to_sys(time);
  return std::chrono::duration_cast<std::chrono::seconds>(sys.time_since_epoch()).count();
}

} // namespace

std::vector<v1::ManifestEntry> ScanTree(const fs::path& root) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    throw util::StorageError("source root is not a directory: " + root.string());
  }

  std::vector<v1::ManifestEntry> entries;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    throw util::StorageError("cannot scan " + root.string() + ": " + ec.message());
  }

  fs::recursive_directory_iterator end;
  for (; it != end; it.increment(ec)) {
    if (ec) {
      throw util::StorageError("scan of " + root.string() + " failed: " + ec.message());
    }

    const auto status = it->symlink_status(ec);
    if (ec) {
      SITEPULL_LOG_WARN("scan entry skipped", {observability::StringField("path", it->path().string()),
                        observability::StringField("error", ec.message())});
      ec.clear();
      continue;
    }
    if (fs::is_directory(status)) {
      if (IsSkippedDir(it->path())) it.disable_recursion_pending();
      continue;
    }
    if (!fs::is_regular_file(status) || ::access(it->path().c_str(), R_OK) != 0) {
      continue;
    }

    const auto size  = it->file_size(ec);
    const auto mtime = ec ? fs::file_time_type{} : it->last_write_time(ec);
    if (ec) {
      ec.clear();
      continue;
    }

    v1::ManifestEntry entry;
    entry.set_path(it->path().lexically_relative(root).generic_string());
    entry.set_size(size);
    entry.set_mtime(ToUnixSeconds(mtime));
    entries.push_back(std::move(entry));
  }
  if (ec) {
    throw util::StorageError("scan of " + root.string() + " failed: " + ec.message());
  }

  std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) { return a.path() < b.path(); });
  return entries;
}

fs::path ResolveWithinRoot(const fs::path& root, std::string_view relative) {
  const auto normalized = util::NormalizeRelativePath(relative);

  std::error_code ec;
  const auto      canonical_root = fs::canonical(root, ec);
  if (ec) {
    throw util::StorageError("source root unavailable: " + root.string());
  }

  const auto candidate = canonical_root / normalized;
  if (!fs::exists(candidate, ec)) {
    throw util::NotFound("file not found: " + normalized);
  }

  const auto resolved = fs::canonical(candidate, ec);
  if (ec) {
    throw util::NotFound("file not found: " + normalized);
  }
  if (!util::IsWithin(canonical_root, resolved)) {
    throw util::ValidationError("path escapes the source root: " + normalized);
  }
  if (!fs::is_regular_file(resolved, ec)) {
    throw util::NotFound("not a regular file: " + normalized);
  }
  return resolved;
}

} // namespace sitepull::manifest
