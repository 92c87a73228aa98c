#include "client/cpp/sitepull_client.h"

#include <algorithm>
#include <cstdint>

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <grpcpp/support/channel_arguments.h>

#include <google/protobuf/empty.pb.h>

#include "internal/grpc/access_key.hpp"
#include "internal/util/errors.hpp"

namespace sitepull::client {

namespace v1 = sitepull::services::v1;

namespace {

constexpr const char* kDefaultPort = "50051";

// Runs the read loop, then checks the final status. A sink failure cancels
// the call; the status of a cancelled call adds nothing to the sink's error.
template <typename Reader, typename ReadAll>
void Drain(::grpc::ClientContext* ctx, Reader* reader, std::string_view action, ReadAll&& read_all) {
  try {
    read_all();
  } catch (const std::exception&) {
    ctx->TryCancel();
    reader->Finish();
    throw;
  }

  const auto status = reader->Finish();
  if (!status.ok()) ThrowStatus(status, action);
}

} // namespace

std::string ParseEndpoint(std::string_view url) {
  if (const auto scheme = url.find("://"); scheme != std::string_view::npos) url.remove_prefix(scheme + 3);
  if (const auto slash = url.find('/'); slash != std::string_view::npos) url = url.substr(0, slash);

  if (url.empty() || url.front() == ':') {
    throw util::ValidationError("endpoint has no host");
  }

  std::string target(url);
  // bracketed IPv6 literals carry their own colons
  const auto colon = target.rfind(':');
  const auto close = target.rfind(']');
  if (colon == std::string::npos || (close != std::string::npos && colon < close)) {
    target += ":";
    target += kDefaultPort;
  }
  return target;
}

void ThrowStatus(const ::grpc::Status& status, std::string_view action) {
  const std::string message = std::string(action) + " failed: " + status.error_message();

  switch (status.error_code()) {
    case ::grpc::StatusCode::NOT_FOUND:
    case ::grpc::StatusCode::INVALID_ARGUMENT:
    case ::grpc::StatusCode::FAILED_PRECONDITION:
      throw util::ProtocolError(message);
    case ::grpc::StatusCode::PERMISSION_DENIED:
    case ::grpc::StatusCode::UNAUTHENTICATED:
    case ::grpc::StatusCode::UNIMPLEMENTED:
      throw util::TransportError(message, false);
    default:
      throw util::TransportError(message, true);
  }
}

GrpcTransport::GrpcTransport(std::shared_ptr<::grpc::Channel> channel, ClientOptions options)
    : options_(std::move(options)),
      export_stub_(v1::ExportService::NewStub(channel)),
      database_stub_(v1::DatabaseJobService::NewStub(channel)),
      manifest_stub_(v1::ManifestService::NewStub(channel)),
      file_stub_(v1::FileService::NewStub(std::move(channel))) {
}

std::shared_ptr<GrpcTransport> GrpcTransport::Connect(std::string_view url, ClientOptions options) {
  ::grpc::ChannelArguments args;
  args.SetMaxReceiveMessageSize(-1);
  auto channel = ::grpc::CreateCustomChannel(ParseEndpoint(url), ::grpc::InsecureChannelCredentials(), args);
  return std::make_shared<GrpcTransport>(std::move(channel), std::move(options));
}

void GrpcTransport::Prepare(::grpc::ClientContext* ctx) const {
  ctx->AddMetadata(sitepull::grpc::kAccessKeyHeader, options_.access_key);
  ctx->set_deadline(std::chrono::system_clock::now() + options_.request_timeout);
}

transfer::DatabaseJobInfo GrpcTransport::InitDatabaseJob(std::uint32_t chunk_size) {
  v1::InitDatabaseJobRequest req;
  req.set_chunk_size(chunk_size);

  v1::InitDatabaseJobResponse resp;
  ::grpc::ClientContext       ctx;
  Prepare(&ctx);

  const auto status = database_stub_->InitJob(&ctx, req, &resp);
  if (!status.ok()) ThrowStatus(status, "InitDatabaseJob");

  return transfer::DatabaseJobInfo{resp.job_id(), resp.total_tables(), resp.total_rows()};
}

transfer::DatabaseJobProgress GrpcTransport::ProcessDatabaseJob(const std::string& job_id, std::optional<std::chrono::milliseconds> time_budget) {
  v1::ProcessDatabaseJobRequest req;
  req.set_job_id(job_id);
  if (time_budget) req.set_time_budget_ms(static_cast<std::uint32_t>(std::max<std::int64_t>(0, time_budget->count())));

  v1::ProcessDatabaseJobResponse resp;
  ::grpc::ClientContext          ctx;
  Prepare(&ctx);

  const auto status = database_stub_->ProcessJob(&ctx, req, &resp);
  if (!status.ok()) ThrowStatus(status, "ProcessDatabaseJob");

  return transfer::DatabaseJobProgress{resp.bytes_written(), resp.completed_tables(), resp.total_tables(), resp.done()};
}

void GrpcTransport::DownloadDatabase(const std::string& job_id, const transfer::ByteSink& sink) {
  v1::DownloadDatabaseJobRequest req;
  req.set_job_id(job_id);

  ::grpc::ClientContext ctx;
  Prepare(&ctx);

  auto reader = database_stub_->DownloadJob(&ctx, req);
  Drain(&ctx, reader.get(), "DownloadDatabase", [&] {
    v1::DataChunk chunk;
    while (reader->Read(&chunk)) sink(chunk.data());
  });
}

void GrpcTransport::FinishDatabaseJob(const std::string& job_id) {
  v1::FinishDatabaseJobRequest req;
  req.set_job_id(job_id);

  google::protobuf::Empty resp;
  ::grpc::ClientContext   ctx;
  Prepare(&ctx);

  const auto status = database_stub_->FinishJob(&ctx, req, &resp);
  if (!status.ok()) ThrowStatus(status, "FinishDatabaseJob");
}

transfer::ManifestJobInfo GrpcTransport::InitManifestJob() {
  v1::InitManifestJobRequest  req;
  v1::InitManifestJobResponse resp;
  ::grpc::ClientContext       ctx;
  Prepare(&ctx);

  const auto status = manifest_stub_->InitJob(&ctx, req, &resp);
  if (!status.ok()) ThrowStatus(status, "InitManifestJob");

  return transfer::ManifestJobInfo{resp.job_id(), resp.total_files(), resp.total_bytes()};
}

transfer::ManifestPageResult GrpcTransport::ManifestPage(const std::string& job_id, std::uint64_t offset, std::uint32_t limit) {
  v1::ManifestPageRequest req;
  req.set_job_id(job_id);
  req.set_offset(offset);
  req.set_limit(limit);

  v1::ManifestPageResponse resp;
  ::grpc::ClientContext    ctx;
  Prepare(&ctx);

  const auto status = manifest_stub_->Page(&ctx, req, &resp);
  if (!status.ok()) ThrowStatus(status, "ManifestPage");

  transfer::ManifestPageResult page;
  page.total_files = resp.total_files();
  page.files.assign(std::make_move_iterator(resp.mutable_files()->begin()), std::make_move_iterator(resp.mutable_files()->end()));
  return page;
}

void GrpcTransport::FinishManifestJob(const std::string& job_id) {
  v1::FinishManifestJobRequest req;
  req.set_job_id(job_id);

  google::protobuf::Empty resp;
  ::grpc::ClientContext   ctx;
  Prepare(&ctx);

  const auto status = manifest_stub_->FinishJob(&ctx, req, &resp);
  if (!status.ok()) ThrowStatus(status, "FinishManifestJob");
}

void GrpcTransport::FetchFile(const std::string& path, const transfer::ByteSink& sink) {
  v1::FetchFileRequest req;
  req.set_path(path);

  ::grpc::ClientContext ctx;
  Prepare(&ctx);

  auto reader = file_stub_->Fetch(&ctx, req);
  Drain(&ctx, reader.get(), "FetchFile", [&] {
    v1::DataChunk chunk;
    while (reader->Read(&chunk)) sink(chunk.data());
  });
}

void GrpcTransport::FetchBatch(const std::vector<std::string>& paths, const transfer::FrameSink& sink) {
  v1::FetchBatchRequest req;
  for (const auto& path : paths) req.add_paths(path);

  ::grpc::ClientContext ctx;
  Prepare(&ctx);

  auto reader = file_stub_->FetchBatch(&ctx, req);
  Drain(&ctx, reader.get(), "FetchBatch", [&] {
    v1::BatchFrame frame;
    while (reader->Read(&frame)) sink(frame.path(), frame.data(), frame.last(), frame.error());
  });
}

v1::InitStreamResponse GrpcTransport::InitStream(const v1::InitStreamRequest& request) const {
  v1::InitStreamResponse resp;
  ::grpc::ClientContext  ctx;
  Prepare(&ctx);

  const auto status = export_stub_->InitStream(&ctx, request, &resp);
  if (!status.ok()) ThrowStatus(status, "InitStream");
  return resp;
}

v1::NextChunkResponse GrpcTransport::NextChunk(const v1::NextChunkRequest& request) const {
  v1::NextChunkResponse resp;
  ::grpc::ClientContext ctx;
  Prepare(&ctx);

  const auto status = export_stub_->NextChunk(&ctx, request, &resp);
  if (!status.ok()) ThrowStatus(status, "NextChunk");
  return resp;
}

} // namespace sitepull::client
