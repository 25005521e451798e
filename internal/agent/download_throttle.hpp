#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace mirrorsync::agent {

/*
  Sleep-based pacing for one download stream.

  After `sent` bytes the stream may not be ahead of start + sent / rate.
  Sleeps are sliced so a cancelled client is noticed within a slice, and
  every stream owns its own throttle, so concurrent downloads never wait on
  each other. A rate of 0 disables pacing.
*/
class DownloadThrottle {
 public:
  static constexpr size_t                    kMinChunk   = 1024;
  static constexpr size_t                    kMaxChunk   = 64 * 1024;
  static constexpr std::chrono::milliseconds kSleepSlice = std::chrono::milliseconds(50);

  explicit DownloadThrottle(uint64_t bytes_per_second);

  // About a tenth of a second of data per chunk, within [kMinChunk, kMaxChunk].
  size_t ChunkSize() const;

  // Blocks until `sent_total` bytes are allowed out. False if cancelled first.
  // Pass the offset one past the chunk about to be sent.
  bool Pace(uint64_t sent_total, const std::function<bool()>& cancelled);

  bool Unlimited() const {
    return rate_ == 0;
  }

 private:
  uint64_t                              rate_;
  std::chrono::steady_clock::time_point start_;
};

} // namespace mirrorsync::agent
