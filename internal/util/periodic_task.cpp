#include "internal/util/periodic_task.hpp"

#include "internal/observability/logging.hpp"

namespace mirrorsync::util {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn)
    : name_(std::move(name)), interval_(interval), fn_(std::move(fn)) {
}

PeriodicTask::~PeriodicTask() {
  Stop();
}

void PeriodicTask::Start(bool run_immediately) {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&PeriodicTask::Loop, this, run_immediately);
}

void PeriodicTask::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void PeriodicTask::Loop(bool run_immediately) {
  if (run_immediately) Tick();

  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, interval_, [this] { return !running_; })) break;

    lock.unlock();
    Tick();
    lock.lock();
  }
}

void PeriodicTask::Tick() {
  try {
    fn_();
  } catch (const std::exception& e) {
    MIRRORSYNC_LOG_WARN("periodic task failed", {observability::StringField("task", name_), observability::StringField("error", e.what())});
  }
}

} // namespace mirrorsync::util
