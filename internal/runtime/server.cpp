#include "server.hpp"

#include <limits>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace sitepull::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &selected_port_);
  // slices and file chunks can exceed the 4 MiB default
  builder.SetMaxReceiveMessageSize(std::numeric_limits<int>::max());
  builder.SetMaxSendMessageSize(std::numeric_limits<int>::max());

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_ || selected_port_ == 0) {
    throw std::runtime_error("Failed to start gRPC server on " + bind_address_);
  }

  SITEPULL_LOG_INFO("sitepull server listening", {observability::StringField("bind_address", bind_address_),
                                                  observability::IntField("port", selected_port_)});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (grpc_server_) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
  }
}

} // namespace sitepull::runtime
