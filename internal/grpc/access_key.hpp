#pragma once

#include <grpcpp/grpcpp.h>

#include <string>
#include <string_view>

namespace sitepull::grpc {

inline constexpr const char* kAccessKeyHeader = "x-sitepull-key";

// Compares in time independent of where the inputs first differ.
bool ConstantTimeEquals(std::string_view a, std::string_view b);

/*
  Shared-secret check run first by every service method.
*/
class AccessKey {
 public:
  explicit AccessKey(std::string key);

  // Throws util::PermissionDenied when the header is missing or wrong.
  void Check(const ::grpc::ServerContext* ctx) const;

 private:
  std::string key_;
};

} // namespace sitepull::grpc
