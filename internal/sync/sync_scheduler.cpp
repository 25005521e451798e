#include "sync_scheduler.hpp"

namespace mirrorsync::sync {

SyncScheduler::EnqueueResult SyncScheduler::Enqueue(const std::string& mirror_id) {
  {
    std::lock_guard lock(mutex_);
    if (!queued_.insert(mirror_id).second) return EnqueueResult::kAlreadyPending;
    queue_.push_back(mirror_id);
  }
  cv_.notify_one();
  return EnqueueResult::kQueued;
}

std::deque<std::string>::iterator SyncScheduler::FirstRunnable() {
  for (auto it = queue_.begin(); it != queue_.end(); ++it) {
    if (!running_.contains(*it)) return it;
  }
  return queue_.end();
}

std::optional<std::string> SyncScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || FirstRunnable() != queue_.end(); });

  if (shutdown_) return std::nullopt;

  auto        it = FirstRunnable();
  std::string id = std::move(*it);
  queue_.erase(it);
  queued_.erase(id);
  running_.insert(id);
  return id;
}

void SyncScheduler::Complete(const std::string& mirror_id) {
  {
    std::lock_guard lock(mutex_);
    running_.erase(mirror_id);
  }
  cv_.notify_all();
}

void SyncScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

size_t SyncScheduler::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace mirrorsync::sync
