#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sitepull/core/v1/types.pb.h"

namespace sitepull::transfer {

struct DatabaseJobInfo {
  std::string   job_id;
  std::uint32_t total_tables = 0;
  std::uint64_t total_rows   = 0;
};

struct DatabaseJobProgress {
  std::uint64_t bytes_written    = 0;
  std::uint32_t completed_tables = 0;
  std::uint32_t total_tables     = 0;
  bool          done             = false;
};

struct ManifestJobInfo {
  std::string   job_id;
  std::uint64_t total_files = 0;
  std::uint64_t total_bytes = 0;
};

struct ManifestPageResult {
  std::vector<sitepull::core::v1::ManifestEntry> files;
  std::uint64_t                                  total_files = 0;
};

// Receives consecutive pieces of one payload. May throw StorageError.
using ByteSink = std::function<void(std::string_view data)>;

// One frame of a batch stream. `last` ends the file; a non-empty `error`
// means the server could not read it.
using FrameSink = std::function<void(const std::string& path, std::string_view data, bool last, const std::string& error)>;

/*
  Client view of the remote endpoint.

  Every call throws TransportError on network failure or a non-OK reply,
  ProtocolError when the reply is malformed or names an unknown job.
  FetchFile and FetchBatch may be called from several threads at once.
*/
class Transport {
 public:
  virtual ~Transport() = default;

  virtual DatabaseJobInfo InitDatabaseJob(std::uint32_t chunk_size) = 0;
  // Without a budget the server applies its configured default.
  virtual DatabaseJobProgress ProcessDatabaseJob(const std::string& job_id, std::optional<std::chrono::milliseconds> time_budget) = 0;
  virtual void                DownloadDatabase(const std::string& job_id, const ByteSink& sink)                                  = 0;
  virtual void                FinishDatabaseJob(const std::string& job_id)                                                       = 0;

  virtual ManifestJobInfo    InitManifestJob()                                                                   = 0;
  virtual ManifestPageResult ManifestPage(const std::string& job_id, std::uint64_t offset, std::uint32_t limit) = 0;
  virtual void               FinishManifestJob(const std::string& job_id)                                        = 0;

  virtual void FetchFile(const std::string& path, const ByteSink& sink)                 = 0;
  virtual void FetchBatch(const std::vector<std::string>& paths, const FrameSink& sink) = 0;
};

} // namespace sitepull::transfer
