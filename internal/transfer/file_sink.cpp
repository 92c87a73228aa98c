#include "file_sink.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/paths.hpp"

namespace sitepull::transfer {

namespace fs = std::filesystem;

FileSink::FileSink(const fs::path& root, const std::string& relative_path)
    : relative_path_(util::NormalizeRelativePath(relative_path)) {
  final_path_ = root / fs::path(relative_path_);
  part_path_  = final_path_;
  part_path_ += ".part";

  std::error_code ec;
  fs::create_directories(final_path_.parent_path(), ec);
  if (ec) {
    throw util::StorageError("cannot create directory " + final_path_.parent_path().string() + ": " + ec.message());
  }

  out_.open(part_path_, std::ios::binary | std::ios::trunc);
  if (!out_) {
    throw util::StorageError("cannot open " + part_path_.string() + " for writing");
  }
}

FileSink::~FileSink() {
  if (!finished_) Discard();
}

void FileSink::Write(std::string_view data) {
  if (data.empty()) return;
  out_.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!out_) {
    throw util::StorageError("write failed: " + part_path_.string());
  }
  bytes_written_ += data.size();
}

void FileSink::Commit() {
  out_.close();
  if (out_.fail()) {
    throw util::StorageError("close failed: " + part_path_.string());
  }

  std::error_code ec;
  fs::rename(part_path_, final_path_, ec);
  if (ec) {
    throw util::StorageError("cannot move " + part_path_.string() + " into place: " + ec.message());
  }
  finished_ = true;
}

void FileSink::Discard() {
  finished_ = true;
  if (out_.is_open()) out_.close();

  std::error_code ec;
  fs::remove(part_path_, ec);
  if (ec) {
    SITEPULL_LOG_WARN("partial file not removed", {observability::StringField("path", part_path_.string()),
                                                    observability::StringField("error", ec.message())});
  }
}

} // namespace sitepull::transfer
