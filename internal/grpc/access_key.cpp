#include "access_key.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace sitepull::grpc {

bool ConstantTimeEquals(std::string_view a, std::string_view b) {
  unsigned char diff = a.size() == b.size() ? 0 : 1;
  const auto    n    = std::max(a.size(), b.size());
  for (std::size_t i = 0; i < n; ++i) {
    const auto x = i < a.size() ? static_cast<unsigned char>(a[i]) : 0;
    const auto y = i < b.size() ? static_cast<unsigned char>(b[i]) : 0;
    diff |= static_cast<unsigned char>(x ^ y);
  }
  return diff == 0;
}

AccessKey::AccessKey(std::string key) : key_(std::move(key)) {
  if (key_.empty()) {
    throw util::ValidationError("access key must not be empty");
  }
}

void AccessKey::Check(const ::grpc::ServerContext* ctx) const {
  const auto& metadata = ctx->client_metadata();
  auto        it       = metadata.find(kAccessKeyHeader);
  if (it == metadata.end() || !ConstantTimeEquals(std::string_view(it->second.data(), it->second.size()), key_)) {
    throw util::PermissionDenied("invalid access key");
  }
}

} // namespace sitepull::grpc
