#pragma once

#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>
#include <grpcpp/support/status.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/transfer/transport.hpp"
#include "sitepull/services/v1/database_job_service.grpc.pb.h"
#include "sitepull/services/v1/export_service.grpc.pb.h"
#include "sitepull/services/v1/file_service.grpc.pb.h"
#include "sitepull/services/v1/manifest_service.grpc.pb.h"

namespace sitepull::client {

struct ClientOptions {
  std::string               access_key;
  std::chrono::milliseconds request_timeout{120000};
};

// "host:port", "host" or "http://host:port/path" to a gRPC target.
// Throws ValidationError when no host can be found.
std::string ParseEndpoint(std::string_view url);

// Converts a non-OK status into the client error taxonomy.
[[noreturn]] void ThrowStatus(const ::grpc::Status& status, std::string_view action);

/*
  Transport over the sitepull gRPC services.

  Each call carries the access key header and a deadline. Stubs are thread
  safe, so one instance serves every retrieval worker.
*/
class GrpcTransport final : public transfer::Transport {
 public:
  GrpcTransport(std::shared_ptr<::grpc::Channel> channel, ClientOptions options);

  static std::shared_ptr<GrpcTransport> Connect(std::string_view url, ClientOptions options);

  transfer::DatabaseJobInfo     InitDatabaseJob(std::uint32_t chunk_size) override;
  transfer::DatabaseJobProgress ProcessDatabaseJob(const std::string& job_id, std::optional<std::chrono::milliseconds> time_budget) override;
  void                          DownloadDatabase(const std::string& job_id, const transfer::ByteSink& sink) override;
  void                          FinishDatabaseJob(const std::string& job_id) override;

  transfer::ManifestJobInfo    InitManifestJob() override;
  transfer::ManifestPageResult ManifestPage(const std::string& job_id, std::uint64_t offset, std::uint32_t limit) override;
  void                         FinishManifestJob(const std::string& job_id) override;

  void FetchFile(const std::string& path, const transfer::ByteSink& sink) override;
  void FetchBatch(const std::vector<std::string>& paths, const transfer::FrameSink& sink) override;

  // Direct access to the cursor protocol.
  sitepull::services::v1::InitStreamResponse InitStream(const sitepull::services::v1::InitStreamRequest& request) const;
  sitepull::services::v1::NextChunkResponse  NextChunk(const sitepull::services::v1::NextChunkRequest& request) const;

 private:
  void Prepare(::grpc::ClientContext* ctx) const;

  ClientOptions                                                     options_;
  std::unique_ptr<sitepull::services::v1::ExportService::Stub>      export_stub_;
  std::unique_ptr<sitepull::services::v1::DatabaseJobService::Stub> database_stub_;
  std::unique_ptr<sitepull::services::v1::ManifestService::Stub>    manifest_stub_;
  std::unique_ptr<sitepull::services::v1::FileService::Stub>        file_stub_;
};

} // namespace sitepull::client
