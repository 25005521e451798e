#include "sync_worker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "sync_orchestrator.hpp"

namespace mirrorsync::sync {

using mirrorsync::observability::StringField;

SyncWorker::SyncWorker(std::shared_ptr<SyncScheduler> scheduler, std::shared_ptr<SyncOrchestrator> orchestrator, size_t threads)
    : scheduler_(std::move(scheduler)), orchestrator_(std::move(orchestrator)), thread_count_(threads == 0 ? 1 : threads) {
}

SyncWorker::~SyncWorker() {
  Stop();
}

void SyncWorker::Start() {
  if (running_.exchange(true)) return;
  for (size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&SyncWorker::Run, this);
  }
}

void SyncWorker::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
}

void SyncWorker::Run() {
  while (running_) {
    auto mirror_id = scheduler_->Dequeue();
    if (!mirror_id) break;

    try {
      orchestrator_->RunPass(*mirror_id);
    } catch (const util::AlreadyRunning&) {
      // a direct RunPass got there first; its result stands
      MIRRORSYNC_LOG_DEBUG("sync pass already running", {StringField("mirror_id", *mirror_id)});
    } catch (const std::exception& e) {
      MIRRORSYNC_LOG_WARN("sync pass failed", {StringField("mirror_id", *mirror_id), StringField("error", e.what())});
    }
    scheduler_->Complete(*mirror_id);
  }
}

} // namespace mirrorsync::sync
