#include "manifest_server.hpp"

#include "grpc_error.hpp"

namespace sitepull::grpc {

namespace v1 = sitepull::services::v1;

ManifestServer::ManifestServer(std::shared_ptr<sitepull::service::ManifestService> svc, std::shared_ptr<const AccessKey> key)
    : service_(std::move(svc)), key_(std::move(key)) {
}

::grpc::Status ManifestServer::InitJob(::grpc::ServerContext* ctx, const v1::InitManifestJobRequest* req, v1::InitManifestJobResponse* resp) {
  try {
    key_->Check(ctx);
    *resp = service_->InitJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ManifestServer::Page(::grpc::ServerContext* ctx, const v1::ManifestPageRequest* req, v1::ManifestPageResponse* resp) {
  try {
    key_->Check(ctx);
    *resp = service_->Page(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ManifestServer::FinishJob(::grpc::ServerContext* ctx, const v1::FinishManifestJobRequest* req, google::protobuf::Empty*) {
  try {
    key_->Check(ctx);
    service_->FinishJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace sitepull::grpc
