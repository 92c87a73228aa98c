#pragma once

#include <filesystem>

namespace sitepull::archive {

/*
  Packs a local directory tree into a single archive file.
*/
class ArchiveBuilder {
 public:
  virtual ~ArchiveBuilder() = default;

  // Throws StorageError on any I/O failure; no partial archive is left.
  virtual void Build(const std::filesystem::path& source_dir, const std::filesystem::path& archive_path) = 0;
};

/*
  Deterministic POSIX ustar writer.

  Regular files only, in sorted path order, with fixed owner, mode and
  mtime so identical trees give byte-identical archives. Paths longer than
  100 bytes are split into prefix and name.
*/
class TarArchiveBuilder final : public ArchiveBuilder {
 public:
  void Build(const std::filesystem::path& source_dir, const std::filesystem::path& archive_path) override;
};

} // namespace sitepull::archive
