#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/grpc_services.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using ledger::runtime::Server;

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
    std::cerr << "Usage: ledgerd <config.yaml> OR ledgerd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = ledger::config::ConfigLoader::LoadFromYaml(config_path);

    ledger::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = ledger::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const std::string bind_address = config.server().bind_address();
    Server            server(bind_address, ledger::grpc::BuildServices(app));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    LEDGER_LOG_INFO("ledgerd started", {ledger::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(250));

    LEDGER_LOG_INFO("Shutting down ledgerd");

    server.Stop();
    app.Shutdown();
    ledger::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    LEDGER_LOG_ERROR("Fatal error", {ledger::observability::StringField("error", e.what())});
    ledger::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
