#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/util/time.hpp"
#include "mirrorsync/v1/types.pb.h"

namespace mirrorsync::db {
class Repository;
}

namespace mirrorsync::heartbeat {

struct HeartbeatOptions {
  std::chrono::milliseconds interval{std::chrono::seconds(60)};
  uint32_t                  timeout_multiplier = 3;
  // Overrides interval * timeout_multiplier when non-zero.
  std::chrono::milliseconds timeout{0};

  std::chrono::milliseconds EffectiveTimeout() const {
    return timeout.count() > 0 ? timeout : interval * timeout_multiplier;
  }
};

/*
  Origin-side liveness tracking.

    approved -> online   first heartbeat
    online   -> online   heartbeat inside the window
    online   -> offline  Sweep() after the timeout
    offline  -> online   any later heartbeat

  Pending and rejected mirrors are never tracked. Going offline keeps the
  mirror's file rows.
*/
class HeartbeatMonitor {
 public:
  HeartbeatMonitor(std::shared_ptr<db::Repository> repository, HeartbeatOptions options, util::MillisClock clock = util::NowMillis);

  // Returns the mirror id and its new status.
  // Throws Unauthenticated (unknown credential) or InvalidState (pending/rejected).
  std::pair<std::string, mirrorsync::v1::MirrorStatus> RecordHeartbeat(const std::string& credential,
                                                                        const mirrorsync::v1::MirrorCounters& counters);

  // Marks stale online mirrors offline; returns their ids.
  std::vector<std::string> Sweep(uint64_t now_ms);
  std::vector<std::string> Sweep();

  const HeartbeatOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  HeartbeatOptions                options_;
  util::MillisClock               clock_;
};

} // namespace mirrorsync::heartbeat
