#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

namespace mirrorsync::sync {

/*
  Thread-safe blocking queue of mirror ids for the sync workers.

  - An id already waiting is not queued twice.
  - An id whose pass is running stays queued until Complete() is called,
    so one mirror is never handed to two workers at once.
*/
class SyncScheduler {
 public:
  enum class EnqueueResult { kQueued, kAlreadyPending };

  EnqueueResult Enqueue(const std::string& mirror_id);

  // Blocks until a runnable id is available; nullopt after Shutdown().
  std::optional<std::string> Dequeue();

  // Marks the pass for mirror_id finished.
  void Complete(const std::string& mirror_id);

  void Shutdown();

  size_t Pending() const;

 private:
  std::deque<std::string>::iterator FirstRunnable();

  mutable std::mutex              mutex_;
  std::condition_variable         cv_;
  std::deque<std::string>         queue_;
  std::unordered_set<std::string> queued_;
  std::unordered_set<std::string> running_;
  bool                            shutdown_ = false;
};

} // namespace mirrorsync::sync
