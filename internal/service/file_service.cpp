#include "file_service.hpp"

#include <fstream>

#include "internal/manifest/scanner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/paths.hpp"

namespace sitepull::service {

using observability::StringField;

FileService::FileService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

bool FileService::StreamFile(const std::filesystem::path& file, const std::function<bool(std::string_view, bool)>& emit) const {
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    throw util::StorageError("cannot open " + file.string());
  }

  std::string buffer(ctx_.options.stream_chunk_bytes, '\0');
  for (;;) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto got = static_cast<std::size_t>(in.gcount());
    if (in.bad()) {
      throw util::StorageError("read failed: " + file.string());
    }

    const bool last = in.eof() || got == 0;
    if (!emit(std::string_view(buffer.data(), got), last)) {
      return false;
    }
    if (last) return true;
  }
}

void FileService::Fetch(const std::string& path, const ChunkSink& sink) {
  const auto file = manifest::ResolveWithinRoot(ctx_.options.source_root, path);
  // empty files produce no chunks at all
  StreamFile(file, [&](std::string_view data, bool) { return data.empty() || sink(data); });
}

void FileService::FetchBatch(const std::vector<std::string>& paths, const FrameSink& sink) {
  std::vector<std::string> normalized;
  normalized.reserve(paths.size());
  for (const auto& path : paths) {
    normalized.push_back(util::NormalizeRelativePath(path));
  }

  for (const auto& path : normalized) {
    std::string error;
    try {
      const auto file = manifest::ResolveWithinRoot(ctx_.options.source_root, path);
      const bool sent = StreamFile(file, [&](std::string_view data, bool last) { return sink(path, data, last, {}); });
      if (!sent) return;
      continue;
    } catch (const util::NotFound& e) {
      error = e.what();
    } catch (const util::ValidationError& e) {
      error = e.what();
    } catch (const util::StorageError& e) {
      error = e.what();
    }

    SITEPULL_LOG_WARN("batch entry unavailable", {StringField("path", path), StringField("error", error)});
    if (!sink(path, {}, true, error)) return;
  }
}

} // namespace sitepull::service
