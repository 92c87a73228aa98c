#include "manifest_service.hpp"

#include <algorithm>

#include "internal/jobs/manifest_job_store.hpp"
#include "internal/manifest/scanner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"

namespace sitepull::service {

namespace v1 = sitepull::services::v1;
using observability::IntField;
using observability::StringField;

ManifestService::ManifestService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

v1::InitManifestJobResponse ManifestService::InitJob(const v1::InitManifestJobRequest&) {
  const auto entries = manifest::ScanTree(ctx_.options.source_root);
  const auto job_id  = util::GenerateJobId();
  const auto meta    = ctx_.manifests->Save(job_id, entries);

  SITEPULL_LOG_INFO("manifest job created", {StringField("job_id", job_id), IntField("files", static_cast<std::int64_t>(meta.total_files())),
                    IntField("chunks", meta.chunk_count())});

  v1::InitManifestJobResponse resp;
  resp.set_job_id(job_id);
  resp.set_total_files(meta.total_files());
  resp.set_total_bytes(meta.total_bytes());
  resp.set_created_at_ms(meta.created_at_ms());
  return resp;
}

v1::ManifestPageResponse ManifestService::Page(const v1::ManifestPageRequest& req) {
  const auto limit = req.limit() == 0 ? ctx_.options.max_page_size : std::min(req.limit(), ctx_.options.max_page_size);

  auto page = ctx_.manifests->LoadPage(req.job_id(), req.offset(), limit);
  if (!page) {
    throw util::NotFound("manifest job not found: " + req.job_id());
  }

  v1::ManifestPageResponse resp;
  for (auto& entry : page->entries) {
    *resp.add_files() = std::move(entry);
  }
  resp.set_total_files(page->meta.total_files());
  resp.set_total_bytes(page->meta.total_bytes());
  resp.set_offset(req.offset());
  resp.set_limit(limit);
  return resp;
}

void ManifestService::FinishJob(const v1::FinishManifestJobRequest& req) {
  ctx_.manifests->Delete(req.job_id());
  SITEPULL_LOG_INFO("manifest job finished", {StringField("job_id", req.job_id())});
}

} // namespace sitepull::service
