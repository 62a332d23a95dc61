#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/config/runtime_options.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/run_worker_pool.hpp"
#include "internal/runtime/server.hpp"

using plancast::factory::Build;
using plancast::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

void ShutdownObservability() {
  plancast::observability::ShutdownLogging();
  plancast::observability::ShutdownMetrics();
  plancast::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: plancast-server <config.yaml> OR plancast-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = plancast::config::ConfigLoader::LoadFromYaml(config_path);

    plancast::observability::InitializeTracing(config);
    plancast::observability::InitializeMetrics(config);
    plancast::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const auto bind_address = plancast::config::ToBindAddress(config);
    Server     server(bind_address, std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    PLANCAST_LOG_INFO("plancast started", {plancast::observability::StringField("bind_address", bind_address),
                                           plancast::observability::IntField("workers", static_cast<int64_t>(app.workers->size()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    PLANCAST_LOG_INFO("shutting down plancast");

    // Stop accepting runs first, then let queued runs finish.
    server.Stop();
    app.workers->Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    PLANCAST_LOG_ERROR("Fatal error", {plancast::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
