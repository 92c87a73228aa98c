#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/grpc/access_key.hpp"
#include "internal/service/file_service.hpp"
#include "sitepull/services/v1/file_service.grpc.pb.h"

namespace sitepull::grpc {

class FileServer final : public sitepull::services::v1::FileService::Service {
 public:
  FileServer(std::shared_ptr<sitepull::service::FileService> svc, std::shared_ptr<const AccessKey> key);

  ::grpc::Status Fetch(::grpc::ServerContext* ctx, const sitepull::services::v1::FetchFileRequest* req,
                       ::grpc::ServerWriter<sitepull::services::v1::DataChunk>* writer) override;

  ::grpc::Status FetchBatch(::grpc::ServerContext* ctx, const sitepull::services::v1::FetchBatchRequest* req,
                            ::grpc::ServerWriter<sitepull::services::v1::BatchFrame>* writer) override;

 private:
  std::shared_ptr<sitepull::service::FileService> service_;
  std::shared_ptr<const AccessKey>                key_;
};

} // namespace sitepull::grpc
