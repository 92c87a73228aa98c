#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/grpc/access_key.hpp"
#include "internal/service/export_service.hpp"
#include "sitepull/services/v1/export_service.grpc.pb.h"

namespace sitepull::grpc {

class ExportServer final : public sitepull::services::v1::ExportService::Service {
 public:
  ExportServer(std::shared_ptr<sitepull::service::ExportService> svc, std::shared_ptr<const AccessKey> key);

  ::grpc::Status InitStream(::grpc::ServerContext* ctx, const sitepull::services::v1::InitStreamRequest* req,
                            sitepull::services::v1::InitStreamResponse* resp) override;

  ::grpc::Status NextChunk(::grpc::ServerContext* ctx, const sitepull::services::v1::NextChunkRequest* req,
                           sitepull::services::v1::NextChunkResponse* resp) override;

 private:
  std::shared_ptr<sitepull::service::ExportService> service_;
  std::shared_ptr<const AccessKey>                  key_;
};

} // namespace sitepull::grpc
