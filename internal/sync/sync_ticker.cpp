#include "sync_ticker.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/model/mirror_status.hpp"
#include "internal/observability/logging.hpp"
#include "sync_scheduler.hpp"

namespace mirrorsync::sync {

SyncTicker::SyncTicker(std::shared_ptr<db::Repository> repository, std::shared_ptr<SyncScheduler> scheduler,
                       std::chrono::milliseconds interval)
    : repository_(std::move(repository)),
      scheduler_(std::move(scheduler)),
      task_("sync-ticker", interval, [this] { EnqueueEligible(); }) {
}

void SyncTicker::Start() {
  task_.Start(true);
}

void SyncTicker::Stop() {
  task_.Stop();
}

size_t SyncTicker::EnqueueEligible() {
  auto tx      = repository_->Begin();
  auto mirrors = repository_->ListMirrors(*tx);
  tx->Commit();

  size_t queued = 0;
  for (const auto& mirror : mirrors) {
    if (!model::IsSyncEligible(mirror.status)) continue;
    if (scheduler_->Enqueue(mirror.id) == SyncScheduler::EnqueueResult::kQueued) ++queued;
  }

  if (queued > 0) {
    MIRRORSYNC_LOG_DEBUG("sync passes queued", {observability::UintField("mirrors", queued)});
  }
  return queued;
}

} // namespace mirrorsync::sync
