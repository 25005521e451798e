#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "sync_scheduler.hpp"

namespace mirrorsync::sync {

class SyncOrchestrator;

/*
  Background workers that drain the SyncScheduler.

  Each worker runs one mirror's pass at a time; with N workers up to N
  mirrors sync in parallel.
*/
class SyncWorker {
 public:
  SyncWorker(std::shared_ptr<SyncScheduler> scheduler, std::shared_ptr<SyncOrchestrator> orchestrator, size_t threads);
  ~SyncWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<SyncScheduler>    scheduler_;
  std::shared_ptr<SyncOrchestrator> orchestrator_;
  size_t                            thread_count_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace mirrorsync::sync
