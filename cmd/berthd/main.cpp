#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/runtime/server.hpp"

using berth::runtime::Server;
using berth::runtime::ServerOptions;

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
    std::cerr << "Usage: berthd <config.yaml> OR berthd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = berth::config::ConfigLoader::LoadFromYaml(config_path);

    berth::observability::InitializeLogging(config);
    berth::observability::InitializeTelemetry(config);

    auto app = berth::factory::Build(config);

    Server server(ServerOptions::FromConfig(config.server()), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    BERTH_LOG_INFO("berthd started", {berth::observability::StringField("bind_address", config.server().bind_address()),
                                      berth::observability::StringField("mode", berth::engine::EngineModeName(app.engine->Mode()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    BERTH_LOG_INFO("Shutting down berthd");

    server.Stop();
    app.engine->Shutdown();
    berth::observability::ShutdownTelemetry();
    berth::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    BERTH_LOG_ERROR("Fatal error", {berth::observability::StringField("error", e.what())});
    berth::observability::ShutdownTelemetry();
    berth::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
