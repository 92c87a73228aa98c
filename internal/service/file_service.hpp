#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "service_context.hpp"

namespace sitepull::service {

/*
  Streams files below the source root.

  Every requested path is normalized up front; a malformed or escaping
  path fails the whole call with util::ValidationError before any byte is
  sent.
*/
class FileService {
 public:
  // Both sinks return false when the receiver went away.
  using ChunkSink = std::function<bool(std::string_view data)>;
  using FrameSink = std::function<bool(const std::string& path, std::string_view data, bool last, const std::string& error)>;

  explicit FileService(ServiceContext ctx);

  // Throws util::NotFound when the file does not exist.
  void Fetch(const std::string& path, const ChunkSink& sink);

  // A file that cannot be read ends with a single frame carrying `error`.
  void FetchBatch(const std::vector<std::string>& paths, const FrameSink& sink);

 private:
  // Returns false when the sink gave up.
  bool StreamFile(const std::filesystem::path& file, const std::function<bool(std::string_view, bool)>& emit) const;

  ServiceContext ctx_;
};

} // namespace sitepull::service
