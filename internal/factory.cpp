#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <string>

#include "internal/config/defaults.hpp"
#include "internal/db/api/kv_store.hpp"
#include "internal/db/api/table_source.hpp"
#include "internal/db/memory/memory_kv_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_kv_store.hpp"
#include "internal/db/sqlite/sqlite_table_source.hpp"
#include "internal/export/export_engine.hpp"
#include "internal/grpc/access_key.hpp"
#include "internal/grpc/database_job_server.hpp"
#include "internal/grpc/export_server.hpp"
#include "internal/grpc/file_server.hpp"
#include "internal/grpc/manifest_server.hpp"
#include "internal/jobs/database_job_store.hpp"
#include "internal/jobs/manifest_job_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/database_job_service.hpp"
#include "internal/service/export_service.hpp"
#include "internal/service/file_service.hpp"
#include "internal/service/manifest_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if SITEPULL_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_table_source.hpp"
#endif

namespace sitepull::factory {

using namespace sitepull;
using runtime::config::RuntimeConfig;

namespace {

constexpr std::chrono::seconds kExpirySweepInterval{60};

std::shared_ptr<db::TableSource> BuildTableSource(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    if (database.sqlite().path().empty()) throw util::ValidationError("database.sqlite.path is required");
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), db::sqlite::SqliteDB::OpenMode::kReadOnly);
    return std::make_shared<db::sqlite::SqliteTableSource>(std::move(sqlite_db));
  }

  if (database.has_postgres()) {
#if SITEPULL_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().uri());
    return std::make_shared<db::postgres::PgTableSource>(std::move(pool));
#else
    throw util::ValidationError("postgres source requested but not enabled at build time");
#endif
  }

  throw util::ValidationError("database section must name a sqlite or postgres source");
}

std::shared_ptr<db::KeyValueStore> BuildKeyValueStore(const RuntimeConfig& config) {
  const auto& store = config.job_store();
  if (store.backend() == "memory") {
    return std::make_shared<db::memory::MemoryKeyValueStore>(store.max_value_bytes());
  }

  if (store.backend() == "sqlite") {
    if (store.sqlite_path().empty()) throw util::ValidationError("job_store.sqlite_path is required for the sqlite backend");
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(store.sqlite_path());
    db::sqlite::SqliteKeyValueStore::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteKeyValueStore>(std::move(sqlite_db), store.max_value_bytes());
  }

  throw util::ValidationError("unknown job_store.backend: " + store.backend());
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Sources and stores
  // ------------------------------------------------------------------
  auto source = BuildTableSource(config);
  auto kv     = BuildKeyValueStore(config);

  const auto ttl = util::ToMillis(config.job_store().ttl(), config::kDefaultJobTtl);

  jobs::JobStoreOptions store_options;
  store_options.ttl               = ttl;
  store_options.entries_per_chunk = config.job_store().entries_per_chunk();

  auto manifests     = std::make_shared<jobs::ManifestJobStore>(kv, store_options);
  auto database_jobs = std::make_shared<jobs::DatabaseJobStore>(kv, ttl);

  std::filesystem::path spool_dir = config.server().spool_dir();
  std::filesystem::create_directories(spool_dir);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine                      = std::make_shared<exporter::ExportEngine>(source);
  ctx.manifests                   = manifests;
  ctx.database_jobs               = database_jobs;
  ctx.options.source_root         = config.server().source_root();
  ctx.options.spool_dir           = spool_dir;
  ctx.options.default_chunk_size  = config.exporter().default_chunk_size();
  ctx.options.default_time_budget = util::ToMillis(config.exporter().default_time_budget(), config::kDefaultTimeBudget);

  if (ctx.options.source_root.empty()) throw util::ValidationError("server.source_root is required");

  auto export_service       = std::make_shared<service::ExportService>(ctx);
  auto database_job_service = std::make_shared<service::DatabaseJobService>(ctx);
  auto manifest_service     = std::make_shared<service::ManifestService>(ctx);
  auto file_service         = std::make_shared<service::FileService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  auto key = std::make_shared<const grpc::AccessKey>(config.server().access_key());

  app.grpc_services.push_back(std::make_unique<grpc::ExportServer>(export_service, key));
  app.grpc_services.push_back(std::make_unique<grpc::DatabaseJobServer>(database_job_service, key));
  app.grpc_services.push_back(std::make_unique<grpc::ManifestServer>(manifest_service, key));
  app.grpc_services.push_back(std::make_unique<grpc::FileServer>(file_service, key));

  // ------------------------------------------------------------------
  // Expiry of abandoned jobs
  // ------------------------------------------------------------------
  auto expiry = std::make_shared<jobs::ExpiryWorker>(kv, spool_dir, ttl, kExpirySweepInterval);
  expiry->Start();
  app.background_workers.push_back(expiry);

  SITEPULL_LOG_INFO("application built", {observability::StringField("job_store", config.job_store().backend()),
                                          observability::StringField("source_root", ctx.options.source_root.string())});
  return app;
}

} // namespace sitepull::factory
