#pragma once

#include <chrono>
#include <memory>

#include "internal/util/periodic_task.hpp"

namespace mirrorsync::pairing {
class PairingService;
}
namespace mirrorsync::registry {
class MirrorRegistry;
}

namespace mirrorsync::heartbeat {

class HeartbeatMonitor;

/*
  Origin housekeeping on its own timer, independent of sync timing:
  marks silent mirrors offline, garbage-collects expired pairing codes and
  refreshes the mirrors-per-status gauge.
*/
class HeartbeatSweeper {
 public:
  HeartbeatSweeper(std::shared_ptr<HeartbeatMonitor> monitor, std::shared_ptr<pairing::PairingService> pairing,
                   std::shared_ptr<registry::MirrorRegistry> registry, std::chrono::milliseconds interval);

  void Start();
  void Stop();

  void SweepOnce();

 private:
  std::shared_ptr<HeartbeatMonitor>         monitor_;
  std::shared_ptr<pairing::PairingService>  pairing_;
  std::shared_ptr<registry::MirrorRegistry> registry_;
  util::PeriodicTask                        task_;
};

} // namespace mirrorsync::heartbeat
