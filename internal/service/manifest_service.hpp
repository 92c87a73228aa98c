#pragma once

#include "service_context.hpp"
#include "sitepull/services/v1/manifest_service.pb.h"

namespace sitepull::service {

class ManifestService {
 public:
  explicit ManifestService(ServiceContext ctx);

  // Scans the source root and stores the result as a new job.
  sitepull::services::v1::InitManifestJobResponse InitJob(const sitepull::services::v1::InitManifestJobRequest& req);

  sitepull::services::v1::ManifestPageResponse Page(const sitepull::services::v1::ManifestPageRequest& req);

  void FinishJob(const sitepull::services::v1::FinishManifestJobRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace sitepull::service
