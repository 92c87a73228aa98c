#include "file_server.hpp"

#include "grpc_error.hpp"

namespace sitepull::grpc {

namespace v1 = sitepull::services::v1;

FileServer::FileServer(std::shared_ptr<sitepull::service::FileService> svc, std::shared_ptr<const AccessKey> key)
    : service_(std::move(svc)), key_(std::move(key)) {
}

::grpc::Status FileServer::Fetch(::grpc::ServerContext* ctx, const v1::FetchFileRequest* req, ::grpc::ServerWriter<v1::DataChunk>* writer) {
  try {
    key_->Check(ctx);
    service_->Fetch(req->path(), [&](std::string_view data) {
      v1::DataChunk chunk;
      chunk.set_data(std::string(data));
      return !ctx->IsCancelled() && writer->Write(chunk);
    });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FileServer::FetchBatch(::grpc::ServerContext* ctx, const v1::FetchBatchRequest* req,
                                      ::grpc::ServerWriter<v1::BatchFrame>* writer) {
  try {
    key_->Check(ctx);
    const std::vector<std::string> paths(req->paths().begin(), req->paths().end());
    service_->FetchBatch(paths, [&](const std::string& path, std::string_view data, bool last, const std::string& error) {
      v1::BatchFrame frame;
      frame.set_path(path);
      frame.set_data(std::string(data));
      frame.set_last(last);
      frame.set_error(error);
      return !ctx->IsCancelled() && writer->Write(frame);
    });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace sitepull::grpc
