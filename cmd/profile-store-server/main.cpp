#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/store_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using profile::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  profile::observability::ShutdownLogging();
  profile::observability::ShutdownMetrics();
  profile::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: profile-store-server <config.yaml> OR profile-store-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = profile::config::ConfigLoader::LoadFromYaml(config_path);

    profile::observability::InitializeTracing(config);
    profile::observability::InitializeMetrics(config);
    profile::observability::InitializeLogging(config);

    if (config.store().has_remote()) {
      throw std::runtime_error("profile-store-server needs a local store backend, not store.remote");
    }
    auto store = profile::factory::BuildStore(config);

    std::vector<std::unique_ptr<grpc::Service>> services;
    services.push_back(std::make_unique<profile::grpc::StoreServer>(store));

    const auto bind_address = config.server().bind_address().empty() ? std::string("0.0.0.0:50061") : config.server().bind_address();
    Server     server(bind_address, std::move(services));

    // handlers go in before Start so an early signal is not lost
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    PROFILE_LOG_INFO("profile store server started", {profile::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    PROFILE_LOG_INFO("shutting down profile store server");
    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    PROFILE_LOG_ERROR("fatal error", {profile::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
