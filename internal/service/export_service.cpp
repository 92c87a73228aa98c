#include "export_service.hpp"

#include "internal/export/export_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/compression.hpp"
#include "internal/util/errors.hpp"

namespace sitepull::service {

namespace v1 = sitepull::services::v1;

ExportService::ExportService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

v1::InitStreamResponse ExportService::InitStream(const v1::InitStreamRequest& req) {
  if (!util::CompressionAvailable(req.compression())) {
    throw util::ValidationError("compression not available in this build");
  }

  auto init = ctx_.engine->Init(req.chunk_size() ? req.chunk_size() : ctx_.options.default_chunk_size);

  v1::InitStreamResponse resp;
  resp.set_cursor(std::move(init.cursor));
  resp.set_preamble(std::move(init.preamble));
  *resp.mutable_metadata() = std::move(init.metadata);

  SITEPULL_LOG_INFO("export stream started", {observability::IntField("tables", resp.metadata().total_tables()),
                    observability::IntField("chunk_size", resp.metadata().chunk_size())});
  return resp;
}

v1::NextChunkResponse ExportService::NextChunk(const v1::NextChunkRequest& req) {
  const auto budget = req.time_budget_ms() ? std::chrono::milliseconds(req.time_budget_ms()) : ctx_.options.default_time_budget;
  auto       step   = ctx_.engine->Next(req.cursor(), budget, req.compression());

  v1::NextChunkResponse resp;
  resp.set_slice(std::move(step.slice));
  resp.set_cursor(std::move(step.cursor));
  resp.set_is_complete(step.is_complete);
  *resp.mutable_progress()    = std::move(step.progress);
  *resp.mutable_performance() = std::move(step.performance);
  return resp;
}

} // namespace sitepull::service
