#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "client/cpp/sitepull_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/config/defaults.hpp"
#include "internal/observability/logging.hpp"
#include "internal/orchestrator/download_orchestrator.hpp"
#include "internal/transfer/progress.hpp"
#include "internal/util/time.hpp"

using namespace sitepull;

namespace {

void Usage() {
  std::cerr << "Usage:\n"
            << "  sitepull download --url <endpoint> --key <access_key> --output <dir>\n"
            << "                    [--concurrency N] [--config <config.yaml>] [--quiet]\n";
}

struct Arguments {
  orchestrator::DownloadRequest request;
  std::string                   config_path;
  bool                          quiet = false;
};

std::optional<Arguments> Parse(int argc, char** argv) {
  if (argc < 2 || std::string(argv[1]) != "download") return std::nullopt;

  Arguments args;
  for (int i = 2; i < argc; ++i) {
    const std::string flag = argv[i];
    if (flag == "--quiet") {
      args.quiet = true;
      continue;
    }
    if (i + 1 >= argc) return std::nullopt;

    const std::string value = argv[++i];
    if (flag == "--url") {
      args.request.url = value;
    } else if (flag == "--key") {
      args.request.access_key = value;
    } else if (flag == "--output") {
      args.request.output_dir = value;
    } else if (flag == "--concurrency") {
      char*      end    = nullptr;
      const auto parsed = std::strtoul(value.c_str(), &end, 10);
      if (end == value.c_str() || *end != '\0' || parsed > 256) return std::nullopt;
      args.request.concurrency = static_cast<std::uint32_t>(parsed);
    } else if (flag == "--config") {
      args.config_path = value;
    } else {
      return std::nullopt;
    }
  }
  return args;
}

/*
  Redraws one progress line on stderr until stopped.
*/
class ProgressReporter {
 public:
  explicit ProgressReporter(const transfer::ProgressAggregator& progress) : progress_(progress) {
    thread_ = std::thread([this] { Run(); });
  }

  ~ProgressReporter() {
    {
      std::lock_guard lock(mutex_);
      stopped_ = true;
    }
    cv_.notify_all();
    thread_.join();
    std::cerr << "\r" << transfer::FormatProgress(progress_.Snapshot()) << std::endl;
  }

 private:
  void Run() {
    std::unique_lock lock(mutex_);
    while (!cv_.wait_for(lock, std::chrono::seconds(1), [this] { return stopped_; })) {
      std::cerr << "\r" << transfer::FormatProgress(progress_.Snapshot()) << std::flush;
    }
  }

  const transfer::ProgressAggregator& progress_;
  std::thread                         thread_;
  std::mutex                          mutex_;
  std::condition_variable             cv_;
  bool                                stopped_ = false;
};

} // namespace

int main(int argc, char** argv) {
  auto args = Parse(argc, argv);
  if (!args) {
    Usage();
    return orchestrator::kExitUsage;
  }

  runtime::config::RuntimeConfig config;
  try {
    if (!args->config_path.empty()) {
      config = config::ConfigLoader::LoadFromYaml(args->config_path);
    } else {
      config::ApplyDefaults(&config);
    }
  } catch (const std::exception& e) {
    std::cerr << "invalid configuration: " << e.what() << std::endl;
    return orchestrator::kExitUsage;
  }

  observability::InitializeLogging(config);

  const auto timeout = util::ToMillis(config.client().request_timeout(), config::kDefaultRequestTimeout);
  auto make_transport = [timeout](const orchestrator::DownloadRequest& request) -> std::shared_ptr<transfer::Transport> {
    return client::GrpcTransport::Connect(request.url, client::ClientOptions{request.access_key, timeout});
  };

  transfer::ProgressAggregator progress;
  int                          code = orchestrator::kExitInternal;
  {
    std::optional<ProgressReporter> reporter;
    if (!args->quiet) reporter.emplace(progress);
    code = orchestrator::HandleDownload(args->request, config.client(), make_transport, std::cout, &progress);
  }

  observability::ShutdownLogging();
  return code;
}
