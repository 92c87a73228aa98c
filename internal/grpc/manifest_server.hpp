#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/grpc/access_key.hpp"
#include "internal/service/manifest_service.hpp"
#include "sitepull/services/v1/manifest_service.grpc.pb.h"

namespace sitepull::grpc {

class ManifestServer final : public sitepull::services::v1::ManifestService::Service {
 public:
  ManifestServer(std::shared_ptr<sitepull::service::ManifestService> svc, std::shared_ptr<const AccessKey> key);

  ::grpc::Status InitJob(::grpc::ServerContext* ctx, const sitepull::services::v1::InitManifestJobRequest* req,
                         sitepull::services::v1::InitManifestJobResponse* resp) override;

  ::grpc::Status Page(::grpc::ServerContext* ctx, const sitepull::services::v1::ManifestPageRequest* req,
                      sitepull::services::v1::ManifestPageResponse* resp) override;

  ::grpc::Status FinishJob(::grpc::ServerContext* ctx, const sitepull::services::v1::FinishManifestJobRequest* req,
                           google::protobuf::Empty* resp) override;

 private:
  std::shared_ptr<sitepull::service::ManifestService> service_;
  std::shared_ptr<const AccessKey>                    key_;
};

} // namespace sitepull::grpc
