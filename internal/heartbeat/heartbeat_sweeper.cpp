#include "internal/heartbeat/heartbeat_sweeper.hpp"

#include <map>

#include "internal/heartbeat/heartbeat_monitor.hpp"
#include "internal/model/mirror_status.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pairing/pairing_service.hpp"
#include "internal/registry/mirror_registry.hpp"

namespace mirrorsync::heartbeat {

HeartbeatSweeper::HeartbeatSweeper(std::shared_ptr<HeartbeatMonitor> monitor, std::shared_ptr<pairing::PairingService> pairing,
                                   std::shared_ptr<registry::MirrorRegistry> registry, std::chrono::milliseconds interval)
    : monitor_(std::move(monitor)),
      pairing_(std::move(pairing)),
      registry_(std::move(registry)),
      task_("heartbeat-sweep", interval, [this] { SweepOnce(); }) {
}

void HeartbeatSweeper::Start() {
  task_.Start();
}

void HeartbeatSweeper::Stop() {
  task_.Stop();
}

void HeartbeatSweeper::SweepOnce() {
  monitor_->Sweep();

  pairing_->CollectExpired();

  std::map<mirrorsync::v1::MirrorStatus, uint64_t> counts = {{mirrorsync::v1::MIRROR_STATUS_PENDING, 0},
                                                             {mirrorsync::v1::MIRROR_STATUS_APPROVED, 0},
                                                             {mirrorsync::v1::MIRROR_STATUS_ONLINE, 0},
                                                             {mirrorsync::v1::MIRROR_STATUS_OFFLINE, 0},
                                                             {mirrorsync::v1::MIRROR_STATUS_REJECTED, 0}};
  for (const auto& mirror : registry_->List()) ++counts[mirror.status];
  for (const auto& [status, count] : counts) {
    observability::Metrics::Instance().SetMirrorsInStatus(model::StatusName(status), count);
  }
}

} // namespace mirrorsync::heartbeat
