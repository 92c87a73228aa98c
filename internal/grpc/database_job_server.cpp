#include "database_job_server.hpp"

#include "grpc_error.hpp"

namespace sitepull::grpc {

namespace v1 = sitepull::services::v1;

DatabaseJobServer::DatabaseJobServer(std::shared_ptr<sitepull::service::DatabaseJobService> svc, std::shared_ptr<const AccessKey> key)
    : service_(std::move(svc)), key_(std::move(key)) {
}

::grpc::Status DatabaseJobServer::InitJob(::grpc::ServerContext* ctx, const v1::InitDatabaseJobRequest* req,
                                          v1::InitDatabaseJobResponse* resp) {
  try {
    key_->Check(ctx);
    *resp = service_->InitJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DatabaseJobServer::ProcessJob(::grpc::ServerContext* ctx, const v1::ProcessDatabaseJobRequest* req,
                                             v1::ProcessDatabaseJobResponse* resp) {
  try {
    key_->Check(ctx);
    *resp = service_->ProcessJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DatabaseJobServer::DownloadJob(::grpc::ServerContext* ctx, const v1::DownloadDatabaseJobRequest* req,
                                              ::grpc::ServerWriter<v1::DataChunk>* writer) {
  try {
    key_->Check(ctx);
    service_->DownloadJob(*req, [&](std::string_view data) {
      v1::DataChunk chunk;
      chunk.set_data(std::string(data));
      return !ctx->IsCancelled() && writer->Write(chunk);
    });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DatabaseJobServer::FinishJob(::grpc::ServerContext* ctx, const v1::FinishDatabaseJobRequest* req, google::protobuf::Empty*) {
  try {
    key_->Check(ctx);
    service_->FinishJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace sitepull::grpc
