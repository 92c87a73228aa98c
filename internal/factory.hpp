#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/jobs/expiry_worker.hpp"

namespace sitepull::factory {

/*
  Everything the server process owns for its lifetime.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>>       grpc_services;
  std::vector<std::shared_ptr<jobs::ExpiryWorker>>    background_workers;
};

/*
  Composition root: the only place that knows concrete table source and
  key/value store types.
*/
Application Build(const sitepull::runtime::config::RuntimeConfig& config);

} // namespace sitepull::factory
