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
    std::cerr << "Usage: mirrorsync-agent <config.yaml> OR mirrorsync-agent --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = mirrorsync::config::ConfigLoader::LoadFromYaml(config_path);
    mirrorsync::config::ValidateAgentConfig(config);

    mirrorsync::observability::InitializeTracing(config, "mirrorsync-agent");
    mirrorsync::observability::InitializeMetrics(config, "mirrorsync-agent");
    mirrorsync::observability::InitializeLogging(config, "mirrorsync-agent");

    auto app = mirrorsync::factory::BuildAgent(config);

    Server server(app.bind_address, app.grpc_services);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    app.Start();
    MIRRORSYNC_LOG_INFO("mirror agent started", {mirrorsync::observability::StringField("bind_address", app.bind_address),
                                                 mirrorsync::observability::StringField("name", config.agent().mirror_name())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    MIRRORSYNC_LOG_INFO("shutting down mirror agent");

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
