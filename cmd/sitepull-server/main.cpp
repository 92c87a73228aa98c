#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using sitepull::factory::Build;
using sitepull::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: sitepull-server <config.yaml> OR sitepull-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = sitepull::config::ConfigLoader::LoadFromYaml(config_path);

    sitepull::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    SITEPULL_LOG_INFO("sitepull server started", {sitepull::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SITEPULL_LOG_INFO("Shutting down sitepull server");

    server.Stop();
    for (auto& worker : app.background_workers) worker->Stop();
    sitepull::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    SITEPULL_LOG_ERROR("Fatal error", {sitepull::observability::StringField("error", e.what())});
    sitepull::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
