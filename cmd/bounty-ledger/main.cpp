#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/bounty_admin_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using bounty::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  bounty::observability::ShutdownLogging();
  bounty::observability::ShutdownMetrics();
  bounty::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: bounty-ledger <config.yaml> OR bounty-ledger --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = bounty::config::ConfigLoader::LoadFromYaml(config_path);

    bounty::observability::InitializeTracing(config);
    bounty::observability::InitializeMetrics(config);
    bounty::observability::InitializeLogging(config);

    auto app = bounty::factory::Build(config);
    if (config.admins_size() == 0) {
      BOUNTY_LOG_WARN("no admins configured; every RPC will be denied");
    }

    std::vector<std::unique_ptr<grpc::Service>> services;
    services.push_back(std::make_unique<bounty::grpc::BountyAdminServer>(app.admin_service));
    Server server(config.server().bind_address(), std::move(services));

    // Handlers go in before Start() so an early signal is not lost.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    BOUNTY_LOG_INFO("shutting down bounty-ledger");
    server.Shutdown();
    ShutdownObservability();
  } catch (const std::exception& e) {
    BOUNTY_LOG_ERROR("fatal error", {bounty::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
