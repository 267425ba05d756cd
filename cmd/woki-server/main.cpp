#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using woki::factory::Build;
using woki::runtime::Server;

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
    std::cerr << "Usage: woki-server <config.yaml> OR woki-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = woki::config::ConfigLoader::LoadFromYaml(config_path);

    woki::observability::InitializeLogging(config);
    if (woki::observability::InitializeTracing(config)) {
      WOKI_LOG_INFO("OTLP tracing enabled");
    }
    if (woki::observability::InitializeMetrics(config)) {
      WOKI_LOG_INFO("OTLP metrics enabled");
    }

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
    WOKI_LOG_INFO("woki started", {woki::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    WOKI_LOG_INFO("Shutting down woki");

    server.Stop();
    woki::observability::ShutdownMetrics();
    woki::observability::ShutdownTracing();
    woki::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    WOKI_LOG_ERROR("Fatal error", {woki::observability::StringField("error", e.what())});
    woki::observability::ShutdownMetrics();
    woki::observability::ShutdownTracing();
    woki::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
