#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace sitepull::transfer {

/*
  Writes one retrieved file under a destination root.

  Data goes to "<path>.part" and is renamed into place on Commit. A sink
  destroyed without Commit removes its partial file.
*/
class FileSink {
 public:
  // Throws ValidationError for paths that would leave `root`, StorageError
  // when the file cannot be created.
  FileSink(const std::filesystem::path& root, const std::string& relative_path);
  ~FileSink();

  FileSink(const FileSink&)            = delete;
  FileSink& operator=(const FileSink&) = delete;

  void Write(std::string_view data);
  void Commit();
  void Discard();

  const std::string& RelativePath() const {
    return relative_path_;
  }
  std::uint64_t BytesWritten() const {
    return bytes_written_;
  }

 private:
  std::string           relative_path_;
  std::filesystem::path final_path_;
  std::filesystem::path part_path_;
  std::ofstream         out_;
  std::uint64_t         bytes_written_ = 0;
  bool                  finished_      = false;
};

} // namespace sitepull::transfer
