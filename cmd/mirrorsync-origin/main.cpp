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
#include "internal/util/errors.hpp"

using mirrorsync::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  mirrorsync::observability::ShutdownLogging();
  mirrorsync::observability::ShutdownMetrics();
  mirrorsync::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: mirrorsync-origin <config.yaml> OR mirrorsync-origin --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = mirrorsync::config::ConfigLoader::LoadFromYaml(config_path);
    mirrorsync::config::ValidateOriginConfig(config);

    mirrorsync::observability::InitializeTracing(config, "mirrorsync-origin");
    mirrorsync::observability::InitializeMetrics(config, "mirrorsync-origin");
    mirrorsync::observability::InitializeLogging(config, "mirrorsync-origin");

    auto app = mirrorsync::factory::BuildOrigin(config);

    Server server(config.server().bind_address(), app.grpc_services);

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    app.Start();
    MIRRORSYNC_LOG_INFO("origin started", {mirrorsync::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    MIRRORSYNC_LOG_INFO("shutting down origin");

    app.Stop();
    server.Stop();
    ShutdownObservability();
  } catch (const mirrorsync::util::ConfigError& e) {
    std::cerr << "configuration error: " << e.what() << std::endl;
    return 2;
  } catch (const std::exception& e) {
    MIRRORSYNC_LOG_ERROR("fatal error", {mirrorsync::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
