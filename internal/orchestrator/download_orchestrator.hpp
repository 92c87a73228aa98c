#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"
#include "internal/archive/archive_builder.hpp"
#include "internal/manifest/partitioner.hpp"
#include "internal/transfer/progress.hpp"
#include "internal/transfer/retrieval_engine.hpp"
#include "internal/transfer/transport.hpp"
#include "run_state.hpp"

namespace sitepull::orchestrator {

inline constexpr int kExitOk       = 0;
inline constexpr int kExitUsage    = 2;
inline constexpr int kExitTransfer = 3;
inline constexpr int kExitInternal = 4;

inline constexpr const char* kDatabaseFileName = "database.sql";
inline constexpr const char* kFilesDirName     = "files";

struct DownloadOptions {
  std::filesystem::path      output_dir;
  std::string                host_label = "site";
  std::uint32_t              chunk_size = 0;
  std::chrono::milliseconds  pacing_delay{100};
  // Per-call budget for server-side database export steps.
  std::optional<std::chrono::milliseconds> db_time_budget;
  std::uint32_t              manifest_page_size = 5000;
  manifest::PartitionOptions partition;
  transfer::RetrievalOptions retrieval;
};

struct DownloadSummary {
  transfer::TransferResult transfer;
  std::uint64_t            total_files    = 0;
  std::uint64_t            total_bytes    = 0;
  std::uint64_t            database_bytes = 0;
  std::filesystem::path    archive_path;
};

// Raised when retrieval finished with failed files.
class RetrievalIncomplete : public std::runtime_error {
 public:
  explicit RetrievalIncomplete(const transfer::TransferResult& result)
      : std::runtime_error("files failed: " + std::to_string(result.files_failed)), result_(result) {
  }

  const transfer::TransferResult& Result() const {
    return result_;
  }

 private:
  transfer::TransferResult result_;
};

/*
  Drives one full pull: database export job, database download, manifest
  job, partition, concurrent retrieval and packaging.

  Work happens in a private workspace under the output directory which is
  removed whatever the outcome; only the archive survives a successful run.
  On failure the state becomes FAILED, any partial archive is removed and
  the error is rethrown.
*/
class DownloadOrchestrator {
 public:
  DownloadOrchestrator(std::shared_ptr<transfer::Transport> transport, std::shared_ptr<archive::ArchiveBuilder> archiver,
                       DownloadOptions options, transfer::ProgressAggregator* progress = nullptr);

  DownloadSummary Run();

  RunState State() const {
    return state_;
  }

 private:
  void TransitionTo(RunState next);

  void                                           ExportDatabase();
  std::uint64_t                                  DownloadDatabase();
  std::vector<sitepull::core::v1::ManifestEntry> CollectManifest();
  void                                           FinishManifestJob(const std::string& job_id);
  void                                           Cleanup(bool remove_archive);

  std::shared_ptr<transfer::Transport>     transport_;
  std::shared_ptr<archive::ArchiveBuilder> archiver_;
  DownloadOptions                          options_;
  transfer::ProgressAggregator*            progress_;

  RunState              state_ = RunState::kInit;
  std::string           db_job_id_;
  std::filesystem::path workspace_;
  std::filesystem::path archive_path_;
  bool                  archive_started_ = false;
};

struct DownloadRequest {
  std::string           url;
  std::string           access_key;
  std::filesystem::path output_dir;
  std::uint32_t         concurrency = 0;
};

using TransportFactory = std::function<std::shared_ptr<transfer::Transport>(const DownloadRequest&)>;

// Host part of an endpoint URL reduced to file-name-safe characters.
std::string HostLabel(std::string_view url);

/*
  CLI entry point. Prints summary lines to `out` and maps the outcome to an
  exit code: 0 success, 2 bad arguments, 3 network or retrieval failure,
  4 anything else.
*/
int HandleDownload(const DownloadRequest& request, const sitepull::runtime::config::ClientConfig& client, const TransportFactory& make_transport,
                   std::ostream& out, transfer::ProgressAggregator* progress = nullptr);

} // namespace sitepull::orchestrator
