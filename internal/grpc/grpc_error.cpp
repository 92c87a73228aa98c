#include "grpc_error.hpp"

#include "internal/observability/logging.hpp"

namespace sitepull::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace sitepull::util;

  if (dynamic_cast<const ProtocolError*>(&e) || dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const PermissionDenied*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const SourceError*>(&e) || dynamic_cast<const TransportError*>(&e)) {
    SITEPULL_LOG_WARN("request failed", {observability::StringField("error", e.what())});
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  SITEPULL_LOG_ERROR("request failed", {observability::StringField("error", e.what())});
  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace sitepull::grpc
