#include "download_orchestrator.hpp"

#include <cctype>
#include <fstream>
#include <ostream>
#include <thread>

#include "internal/config/defaults.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"
#include "internal/util/time.hpp"

namespace sitepull::orchestrator {

namespace fs = std::filesystem;
using observability::FormatBytes;
using observability::IntField;
using observability::StringField;

DownloadOrchestrator::DownloadOrchestrator(std::shared_ptr<transfer::Transport> transport, std::shared_ptr<archive::ArchiveBuilder> archiver,
                                           DownloadOptions options, transfer::ProgressAggregator* progress)
    : transport_(std::move(transport)), archiver_(std::move(archiver)), options_(std::move(options)), progress_(progress) {
  if (options_.manifest_page_size == 0) options_.manifest_page_size = 5000;
}

void DownloadOrchestrator::TransitionTo(RunState next) {
  if (!CanTransition(state_, next)) {
    throw util::InvalidState("illegal transition " + std::string(ToString(state_)) + " -> " + std::string(ToString(next)));
  }
  SITEPULL_LOG_INFO("state", {StringField("from", std::string(ToString(state_))), StringField("to", std::string(ToString(next)))});
  state_ = next;
}

DownloadSummary DownloadOrchestrator::Run() {
  if (state_ != RunState::kInit) {
    throw util::InvalidState("download already ran");
  }

  const auto stamp = util::FormatCompactUtc(util::Now());
  workspace_       = options_.output_dir / (".sitepull-work-" + stamp + "-" + util::GenerateJobId(6));
  archive_path_    = options_.output_dir / "archives" / (options_.host_label + "-" + stamp + ".tar");

  DownloadSummary summary;
  try {
    fs::create_directories(workspace_ / kFilesDirName);

    TransitionTo(RunState::kDbExport);
    ExportDatabase();

    TransitionTo(RunState::kDbDownload);
    summary.database_bytes = DownloadDatabase();

    TransitionTo(RunState::kManifestInit);
    const auto entries = CollectManifest();

    TransitionTo(RunState::kPartition);
    const auto partition = manifest::PartitionManifest(entries, options_.partition);
    const auto units     = transfer::BuildUnits(partition);
    summary.total_files  = partition.total_files;
    summary.total_bytes  = partition.total_bytes;
    if (progress_) progress_->SetTotals(partition.total_files, partition.total_bytes);

    SITEPULL_LOG_INFO("manifest partitioned", {IntField("files", static_cast<std::int64_t>(partition.total_files)),
                                               IntField("large", static_cast<std::int64_t>(partition.large.size())),
                                               IntField("batches", static_cast<std::int64_t>(partition.batches.size())),
                                               StringField("bytes", FormatBytes(partition.total_bytes))});

    TransitionTo(RunState::kRetrieve);
    transfer::RetrievalEngine engine(transport_, options_.retrieval, progress_);
    summary.transfer = engine.Retrieve(units, workspace_ / kFilesDirName, [this](std::uint64_t bytes) {
      if (progress_) progress_->AddBytes(bytes);
    });
    if (summary.transfer.files_failed > 0) {
      throw RetrievalIncomplete(summary.transfer);
    }

    TransitionTo(RunState::kPackage);
    archive_started_ = true;
    archiver_->Build(workspace_, archive_path_);
    summary.archive_path = archive_path_;

    TransitionTo(RunState::kDone);
  } catch (const std::exception& e) {
    SITEPULL_LOG_ERROR("download failed", {StringField("state", std::string(ToString(state_))), StringField("error", e.what())});
    if (!IsTerminal(state_)) TransitionTo(RunState::kFailed);
    Cleanup(true);
    throw;
  }

  Cleanup(false);
  return summary;
}

void DownloadOrchestrator::ExportDatabase() {
  const auto job = transport_->InitDatabaseJob(options_.chunk_size);
  db_job_id_     = job.job_id;
  if (db_job_id_.empty()) throw util::ProtocolError("database job init returned no job id");

  SITEPULL_LOG_INFO("database job started", {StringField("job_id", db_job_id_), IntField("tables", job.total_tables),
                                             IntField("rows", static_cast<std::int64_t>(job.total_rows))});

  for (;;) {
    const auto step = transport_->ProcessDatabaseJob(db_job_id_, options_.db_time_budget);
    if (progress_) progress_->SetDatabaseProgress(step.bytes_written, step.completed_tables, step.total_tables);

    SITEPULL_LOG_DEBUG("database job step", {IntField("tables_done", step.completed_tables), IntField("tables", step.total_tables),
                                             StringField("written", FormatBytes(step.bytes_written))});
    if (step.done) break;

    std::this_thread::sleep_for(options_.pacing_delay);
  }
}

std::uint64_t DownloadOrchestrator::DownloadDatabase() {
  const auto    path  = workspace_ / kDatabaseFileName;
  std::uint64_t bytes = 0;

  try {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw util::StorageError("cannot create " + path.string());

    transport_->DownloadDatabase(db_job_id_, [&](std::string_view data) {
      out.write(data.data(), static_cast<std::streamsize>(data.size()));
      if (!out) throw util::StorageError("write failed: " + path.string());
      bytes += data.size();
    });

    out.close();
    if (out.fail()) throw util::StorageError("cannot finish " + path.string());
    if (bytes == 0) throw util::ProtocolError("database download was empty");
  } catch (const std::exception&) {
    std::error_code ec;
    fs::remove(path, ec);
    throw;
  }

  try {
    transport_->FinishDatabaseJob(db_job_id_);
  } catch (const std::exception& e) {
    SITEPULL_LOG_WARN("database job finish failed", {StringField("job_id", db_job_id_), StringField("error", e.what())});
  }

  SITEPULL_LOG_INFO("database downloaded", {StringField("size", FormatBytes(bytes))});
  return bytes;
}

std::vector<sitepull::core::v1::ManifestEntry> DownloadOrchestrator::CollectManifest() {
  const auto job = transport_->InitManifestJob();
  if (job.job_id.empty()) throw util::ProtocolError("manifest job init returned no job id");

  SITEPULL_LOG_INFO("manifest job started", {StringField("job_id", job.job_id), IntField("files", static_cast<std::int64_t>(job.total_files)),
                                             StringField("bytes", FormatBytes(job.total_bytes))});

  std::vector<sitepull::core::v1::ManifestEntry> entries;
  try {
    entries.reserve(job.total_files);
    while (entries.size() < job.total_files) {
      auto page = transport_->ManifestPage(job.job_id, entries.size(), options_.manifest_page_size);
      if (page.files.empty()) {
        throw util::ProtocolError("manifest ended at " + std::to_string(entries.size()) + " of " + std::to_string(job.total_files) + " files");
      }
      for (auto& entry : page.files) entries.push_back(std::move(entry));
    }
  } catch (const std::exception&) {
    FinishManifestJob(job.job_id);
    throw;
  }

  FinishManifestJob(job.job_id);
  return entries;
}

void DownloadOrchestrator::FinishManifestJob(const std::string& job_id) {
  try {
    transport_->FinishManifestJob(job_id);
  } catch (const std::exception& e) {
    SITEPULL_LOG_WARN("manifest job finish failed", {StringField("job_id", job_id), StringField("error", e.what())});
  }
}

void DownloadOrchestrator::Cleanup(bool remove_archive) {
  std::error_code ec;
  fs::remove_all(workspace_, ec);
  if (ec) SITEPULL_LOG_WARN("workspace not removed", {StringField("path", workspace_.string()), StringField("error", ec.message())});

  // only an archive this run started writing
  if (remove_archive && archive_started_ && fs::exists(archive_path_, ec)) {
    fs::remove(archive_path_, ec);
  }
}

std::string HostLabel(std::string_view url) {
  if (const auto scheme = url.find("://"); scheme != std::string_view::npos) url.remove_prefix(scheme + 3);
  if (const auto at = url.find('@'); at != std::string_view::npos) url.remove_prefix(at + 1);

  std::string label;
  for (char c : url) {
    if (c == '/' || c == ':' || c == '?' || c == '#') break;
    const auto uc = static_cast<unsigned char>(c);
    label.push_back(std::isalnum(uc) || c == '.' || c == '-' ? static_cast<char>(std::tolower(uc)) : '_');
  }
  return label.empty() ? "site" : label;
}

int HandleDownload(const DownloadRequest& request, const sitepull::runtime::config::ClientConfig& client, const TransportFactory& make_transport,
                   std::ostream& out, transfer::ProgressAggregator* progress) {
  try {
    if (request.url.empty()) throw util::ValidationError("--url is required");
    if (request.access_key.empty()) throw util::ValidationError("--key is required");
    if (request.output_dir.empty()) throw util::ValidationError("--output is required");

    DownloadOptions options;
    options.output_dir                = request.output_dir;
    options.host_label                = HostLabel(request.url);
    options.pacing_delay              = util::ToMillis(client.pacing_delay(), config::kDefaultPacingDelay);
    options.manifest_page_size        = client.manifest_page_size();
    if (client.has_db_time_budget()) options.db_time_budget = util::ToMillis(client.db_time_budget(), config::kDefaultTimeBudget);
    options.partition.large_threshold = client.large_file_threshold_bytes();
    options.partition.batch_byte_cap  = client.batch_byte_cap();
    options.partition.batch_count_cap = client.batch_count_cap();
    options.retrieval.concurrency     = request.concurrency ? request.concurrency : client.concurrency();
    options.retrieval.max_attempts    = client.max_attempts();
    options.retrieval.retry_backoff   = util::ToMillis(client.retry_backoff(), config::kDefaultRetryBackoff);

    std::error_code ec;
    fs::create_directories(options.output_dir, ec);
    if (ec) throw util::ValidationError("cannot create output directory " + options.output_dir.string() + ": " + ec.message());

    DownloadOrchestrator orchestrator(make_transport(request), std::make_shared<archive::TarArchiveBuilder>(), std::move(options), progress);
    const auto summary = orchestrator.Run();

    out << "database: " << FormatBytes(summary.database_bytes) << "\n";
    out << "files: " << summary.transfer.files_succeeded << "/" << summary.total_files << " ("
        << FormatBytes(summary.transfer.bytes_transferred) << ")\n";
    out << "archive: " << summary.archive_path.string() << "\n";
    return kExitOk;
  } catch (const RetrievalIncomplete& e) {
    out << "files failed: " << e.Result().files_failed << "\n";
    return kExitTransfer;
  } catch (const util::ValidationError& e) {
    out << "invalid arguments: " << e.what() << "\n";
    return kExitUsage;
  } catch (const util::TransportError& e) {
    out << "transfer failed: " << e.what() << "\n";
    return kExitTransfer;
  } catch (const util::ProtocolError& e) {
    out << "transfer failed: " << e.what() << "\n";
    return kExitTransfer;
  } catch (const std::exception& e) {
    out << "internal error: " << e.what() << "\n";
    return kExitInternal;
  }
}

} // namespace sitepull::orchestrator
