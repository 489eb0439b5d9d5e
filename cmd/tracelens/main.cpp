#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/grpc/application.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using tracelens::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  tracelens::observability::ShutdownLogging();
  tracelens::observability::ShutdownMetrics();
  tracelens::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: tracelens <config.yaml> OR tracelens --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = tracelens::config::ConfigLoader::LoadFromYaml(config_path);

    tracelens::observability::InitializeTracing(config);
    tracelens::observability::InitializeMetrics(config);
    tracelens::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = tracelens::grpc::BuildApplication(config);

    const auto bind_address = config.server().bind_address().empty() ? std::string("0.0.0.0:50051") : config.server().bind_address();

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(bind_address, std::move(app.grpc_services), config.server().max_message_bytes());

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    TRACELENS_LOG_INFO("TraceLens started", {tracelens::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    TRACELENS_LOG_INFO("Shutting down TraceLens");

    server.Stop();
    app.services.workers->Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    TRACELENS_LOG_ERROR("Fatal error", {tracelens::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
