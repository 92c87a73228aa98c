#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

namespace sitepull::exporter { class ExportEngine; }
namespace sitepull::jobs { class ManifestJobStore; class DatabaseJobStore; }

namespace sitepull::service {

struct ServiceOptions {
  std::filesystem::path     source_root;
  std::filesystem::path     spool_dir;
  std::uint32_t             default_chunk_size  = 1000;
  std::chrono::milliseconds default_time_budget{5000};
  std::uint32_t             max_page_size       = 5000;
  std::size_t               stream_chunk_bytes  = 256 * 1024;
};

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<sitepull::exporter::ExportEngine> engine;
  std::shared_ptr<sitepull::jobs::ManifestJobStore> manifests;
  std::shared_ptr<sitepull::jobs::DatabaseJobStore> database_jobs;
  ServiceOptions                                    options;
};

} // namespace sitepull::service
