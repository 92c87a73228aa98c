#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/grpc/access_key.hpp"
#include "internal/service/database_job_service.hpp"
#include "sitepull/services/v1/database_job_service.grpc.pb.h"

namespace sitepull::grpc {

class DatabaseJobServer final : public sitepull::services::v1::DatabaseJobService::Service {
 public:
  DatabaseJobServer(std::shared_ptr<sitepull::service::DatabaseJobService> svc, std::shared_ptr<const AccessKey> key);

  ::grpc::Status InitJob(::grpc::ServerContext* ctx, const sitepull::services::v1::InitDatabaseJobRequest* req,
                         sitepull::services::v1::InitDatabaseJobResponse* resp) override;

  ::grpc::Status ProcessJob(::grpc::ServerContext* ctx, const sitepull::services::v1::ProcessDatabaseJobRequest* req,
                            sitepull::services::v1::ProcessDatabaseJobResponse* resp) override;

  ::grpc::Status DownloadJob(::grpc::ServerContext* ctx, const sitepull::services::v1::DownloadDatabaseJobRequest* req,
                             ::grpc::ServerWriter<sitepull::services::v1::DataChunk>* writer) override;

  ::grpc::Status FinishJob(::grpc::ServerContext* ctx, const sitepull::services::v1::FinishDatabaseJobRequest* req,
                           google::protobuf::Empty* resp) override;

 private:
  std::shared_ptr<sitepull::service::DatabaseJobService> service_;
  std::shared_ptr<const AccessKey>                       key_;
};

} // namespace sitepull::grpc
