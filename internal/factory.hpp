#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace mirrorsync::db {
class Repository;
}
namespace mirrorsync::storage {
class ContentStore;
}
namespace mirrorsync::registry {
class MirrorRegistry;
}
namespace mirrorsync::pairing {
class PairingService;
}
namespace mirrorsync::heartbeat {
class HeartbeatMonitor;
class HeartbeatSweeper;
} // namespace mirrorsync::heartbeat
namespace mirrorsync::sync {
class MirrorTransport;
class SyncOrchestrator;
class SyncScheduler;
class SyncTicker;
class SyncWorker;
} // namespace mirrorsync::sync
namespace mirrorsync::routing {
class DownloadRouter;
}
namespace mirrorsync::agent {
class HeartbeatSender;
class MirrorAgent;
class OriginLink;
} // namespace mirrorsync::agent
namespace mirrorsync::util {
class PeriodicTask;
}

namespace mirrorsync::factory {

// Opens the configured backend and applies the schema. Memory when unset.
std::shared_ptr<db::Repository> BuildRepository(const mirrorsync::runtime::config::RuntimeConfig& config);

/*
  OriginApplication

  Every long-lived origin object. Background loops run between Start()
  and Stop(); the gRPC adapters are handed to runtime::Server.
*/
struct OriginApplication {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<storage::ContentStore>       archive;
  std::shared_ptr<registry::MirrorRegistry>    registry;
  std::shared_ptr<pairing::PairingService>     pairing;
  std::shared_ptr<heartbeat::HeartbeatMonitor> heartbeat;
  std::shared_ptr<heartbeat::HeartbeatSweeper> sweeper;
  std::shared_ptr<sync::SyncOrchestrator>      orchestrator;
  std::shared_ptr<sync::SyncScheduler>         scheduler;
  std::shared_ptr<sync::SyncWorker>            workers;
  std::shared_ptr<sync::SyncTicker>            ticker;
  std::shared_ptr<routing::DownloadRouter>     router;

  std::vector<std::shared_ptr<::grpc::Service>> grpc_services;

  void Start();
  void Stop();
};

// transport defaults to gRPC calls to each mirror's endpoint.
OriginApplication BuildOrigin(const mirrorsync::runtime::config::RuntimeConfig& config,
                              std::shared_ptr<sync::MirrorTransport>        transport = nullptr);

struct AgentApplication {
  std::shared_ptr<db::Repository>         repository;
  std::shared_ptr<storage::ContentStore>  store;
  std::shared_ptr<agent::OriginLink>      origin;
  std::shared_ptr<agent::MirrorAgent>     agent;
  std::shared_ptr<agent::HeartbeatSender> heartbeat;
  std::shared_ptr<util::PeriodicTask>     maintenance;

  std::string bind_address;
  // redeemed at Start() when the node is unpaired
  std::string pairing_code;

  std::vector<std::shared_ptr<::grpc::Service>> grpc_services;

  void Start();
  void Stop();
};

// origin defaults to a gRPC client for agent.origin_url.
AgentApplication BuildAgent(const mirrorsync::runtime::config::RuntimeConfig& config, std::shared_ptr<agent::OriginLink> origin = nullptr);

} // namespace mirrorsync::factory
