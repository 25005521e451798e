#pragma once

#include <chrono>
#include <cstddef>
#include <memory>

#include "internal/util/periodic_task.hpp"

namespace mirrorsync::db {
class Repository;
}

namespace mirrorsync::sync {

class SyncScheduler;

/*
  Periodically queues every approved or online mirror for a sync pass.
  Catalog-change notifications call EnqueueEligible() directly.
*/
class SyncTicker {
 public:
  SyncTicker(std::shared_ptr<db::Repository> repository, std::shared_ptr<SyncScheduler> scheduler, std::chrono::milliseconds interval);

  void Start();
  void Stop();

  // Returns how many mirrors were newly queued.
  size_t EnqueueEligible();

 private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<SyncScheduler>  scheduler_;
  util::PeriodicTask              task_;
};

} // namespace mirrorsync::sync
