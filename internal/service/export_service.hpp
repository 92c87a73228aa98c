#pragma once

#include "service_context.hpp"
#include "sitepull/services/v1/export_service.pb.h"

namespace sitepull::service {

// Stateless cursor protocol; the caller carries the cursor.
class ExportService {
 public:
  explicit ExportService(ServiceContext ctx);

  sitepull::services::v1::InitStreamResponse InitStream(const sitepull::services::v1::InitStreamRequest& req);

  sitepull::services::v1::NextChunkResponse NextChunk(const sitepull::services::v1::NextChunkRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace sitepull::service
