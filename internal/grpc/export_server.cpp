#include "export_server.hpp"

#include "grpc_error.hpp"

namespace sitepull::grpc {

namespace v1 = sitepull::services::v1;

ExportServer::ExportServer(std::shared_ptr<sitepull::service::ExportService> svc, std::shared_ptr<const AccessKey> key)
    : service_(std::move(svc)), key_(std::move(key)) {
}

::grpc::Status ExportServer::InitStream(::grpc::ServerContext* ctx, const v1::InitStreamRequest* req, v1::InitStreamResponse* resp) {
  try {
    key_->Check(ctx);
    *resp = service_->InitStream(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ExportServer::NextChunk(::grpc::ServerContext* ctx, const v1::NextChunkRequest* req, v1::NextChunkResponse* resp) {
  try {
    key_->Check(ctx);
    *resp = service_->NextChunk(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace sitepull::grpc
