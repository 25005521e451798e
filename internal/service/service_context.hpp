#pragma once

#include <memory>
#include <string>

namespace mirrorsync::db {
class Repository;
}
namespace mirrorsync::registry {
class MirrorRegistry;
}
namespace mirrorsync::pairing {
class PairingService;
}
namespace mirrorsync::heartbeat {
class HeartbeatMonitor;
}
namespace mirrorsync::sync {
class SyncScheduler;
class SyncTicker;
} // namespace mirrorsync::sync
namespace mirrorsync::routing {
class DownloadRouter;
}
namespace mirrorsync::storage {
class ContentStore;
}

namespace mirrorsync::service {

/*
  Dependency container shared by the origin services.
*/
struct ServiceContext {
  std::shared_ptr<mirrorsync::db::Repository>             repository;
  std::shared_ptr<mirrorsync::registry::MirrorRegistry>   registry;
  std::shared_ptr<mirrorsync::pairing::PairingService>    pairing;
  std::shared_ptr<mirrorsync::heartbeat::HeartbeatMonitor> heartbeat;
  std::shared_ptr<mirrorsync::sync::SyncScheduler>        scheduler;
  std::shared_ptr<mirrorsync::sync::SyncTicker>           ticker;
  std::shared_ptr<mirrorsync::routing::DownloadRouter>    router;
  // authoritative content, keyed by catalog filename
  std::shared_ptr<mirrorsync::storage::ContentStore> archive;

  std::string admin_token;
  bool        sync_on_catalog_change = true;
};

} // namespace mirrorsync::service
