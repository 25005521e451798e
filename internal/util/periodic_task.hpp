#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace mirrorsync::util {

/*
  Runs a callback on its own thread every `interval` until stopped.

  Stop() wakes the thread immediately rather than waiting out the interval.
  Exceptions from the callback are logged and the loop keeps going.
*/
class PeriodicTask {
 public:
  PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&)            = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  // run_immediately fires the first tick at start instead of after one interval.
  void Start(bool run_immediately = false);
  void Stop();

  bool Running() const {
    return running_.load();
  }

 private:
  void Loop(bool run_immediately);
  void Tick();

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::function<void()>     fn_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace mirrorsync::util
