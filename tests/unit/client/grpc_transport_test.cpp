#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include <grpcpp/grpcpp.h>

#include "client/cpp/sitepull_client.h"
#include "internal/util/errors.hpp"

namespace {

using sitepull::client::ParseEndpoint;
using sitepull::client::ThrowStatus;

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestParseEndpoint() {
  assert(ParseEndpoint("example.com") == "example.com:50051");
  assert(ParseEndpoint("example.com:7000") == "example.com:7000");
  assert(ParseEndpoint("https://example.com/wp-admin") == "example.com:50051");
  assert(ParseEndpoint("http://127.0.0.1:6000/") == "127.0.0.1:6000");
  assert(ParseEndpoint("[::1]") == "[::1]:50051");
  assert(ParseEndpoint("[::1]:6000") == "[::1]:6000");

  assert(Throws<sitepull::util::ValidationError>([] { (void)ParseEndpoint(""); }));
  assert(Throws<sitepull::util::ValidationError>([] { (void)ParseEndpoint("https:///path"); }));
  assert(Throws<sitepull::util::ValidationError>([] { (void)ParseEndpoint(":50051"); }));
}

bool Retryable(::grpc::StatusCode code) {
  try {
    ThrowStatus(::grpc::Status(code, "x"), "Call");
  } catch (const sitepull::util::TransportError& e) {
    return e.Retryable();
  } catch (const sitepull::util::ProtocolError&) {
    return false;
  }
  return false;
}

void TestStatusMapping() {
  for (auto code : {::grpc::StatusCode::NOT_FOUND, ::grpc::StatusCode::INVALID_ARGUMENT, ::grpc::StatusCode::FAILED_PRECONDITION}) {
    assert(Throws<sitepull::util::ProtocolError>([&] { ThrowStatus(::grpc::Status(code, "bad"), "Page"); }));
  }
  for (auto code : {::grpc::StatusCode::PERMISSION_DENIED, ::grpc::StatusCode::UNAUTHENTICATED, ::grpc::StatusCode::UNIMPLEMENTED}) {
    assert(Throws<sitepull::util::TransportError>([&] { ThrowStatus(::grpc::Status(code, "no"), "Page"); }));
    assert(!Retryable(code));
  }
  for (auto code : {::grpc::StatusCode::UNAVAILABLE, ::grpc::StatusCode::DEADLINE_EXCEEDED, ::grpc::StatusCode::INTERNAL,
                    ::grpc::StatusCode::RESOURCE_EXHAUSTED}) {
    assert(Retryable(code));
  }

  try {
    ThrowStatus(::grpc::Status(::grpc::StatusCode::NOT_FOUND, "manifest job not found: j1"), "ManifestPage");
  } catch (const sitepull::util::ProtocolError& e) {
    assert(std::string(e.what()) == "ManifestPage failed: manifest job not found: j1");
  }
}

void TestUnreachableServerIsRetryable() {
  sitepull::client::ClientOptions options;
  options.access_key      = "secret";
  options.request_timeout = std::chrono::milliseconds(300);

  // nothing listens on the discard port
  auto transport = sitepull::client::GrpcTransport::Connect("127.0.0.1:9", options);

  bool retryable = false;
  try {
    (void)transport->InitManifestJob();
  } catch (const sitepull::util::TransportError& e) {
    retryable = e.Retryable();
  }
  assert(retryable);
}

} // namespace

int main() {
  TestParseEndpoint();
  TestStatusMapping();
  TestUnreachableServerIsRetryable();

  std::cout << "sitepull_unit_client_transport: pass\n";
  return 0;
}
