#pragma once

#include <chrono>
#include <memory>

#include "internal/util/periodic_task.hpp"

namespace mirrorsync::agent {

class MirrorAgent;
class OriginLink;

// Reports this node's counters to the origin every interval once paired.
class HeartbeatSender {
 public:
  HeartbeatSender(std::shared_ptr<MirrorAgent> agent, std::shared_ptr<OriginLink> origin, std::chrono::milliseconds interval);

  void Start();
  void Stop();

  // One heartbeat; false when nothing was sent or the origin refused it.
  bool SendOnce();

 private:
  std::shared_ptr<MirrorAgent> agent_;
  std::shared_ptr<OriginLink>  origin_;
  util::PeriodicTask           task_;
};

} // namespace mirrorsync::agent
