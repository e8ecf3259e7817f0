#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "internal/broker/broker_channel.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/worker/worker_pool.hpp"

using analysis::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  analysis::observability::ShutdownLogging();
  analysis::observability::ShutdownMetrics();
  analysis::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else if (argc != 1) {
    std::cerr << "Usage: analysis-worker [<config.yaml> | --config <config.yaml>]" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration (environment only when no file is given)
    // ------------------------------------------------------------
    auto config = config_path.empty() ? analysis::config::ConfigLoader::LoadFromEnvironment()
                                      : analysis::config::ConfigLoader::LoadFromYaml(config_path);

    analysis::observability::InitializeTracing(config);
    analysis::observability::InitializeMetrics(config);
    analysis::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = analysis::factory::Build(config);

    std::optional<Server> server;
    if (!config.server().bind_address().empty()) {
      server.emplace(config.server(), std::move(app.grpc_services));
    }

    // Register signal handlers before starting workers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    if (server) {
      server->Start();
    }
    app.pool->Start();
    ANALYSIS_LOG_INFO("analysis worker started", {analysis::observability::StringField("bind_address", config.server().bind_address()),
                                                  analysis::observability::IntField("workers", static_cast<int64_t>(app.pool->Size()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    ANALYSIS_LOG_INFO("Shutting down analysis worker");

    if (server) {
      server->Stop();
    }
    app.broker->Shutdown();
    app.pool->Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    ANALYSIS_LOG_ERROR("Fatal error", {analysis::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
