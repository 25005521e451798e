#include "internal/agent/download_throttle.hpp"

#include <algorithm>
#include <thread>

namespace mirrorsync::agent {

DownloadThrottle::DownloadThrottle(uint64_t bytes_per_second) : rate_(bytes_per_second), start_(std::chrono::steady_clock::now()) {
}

size_t DownloadThrottle::ChunkSize() const {
  if (rate_ == 0) return kMaxChunk;
  return std::clamp(static_cast<size_t>(rate_ / 10), kMinChunk, kMaxChunk);
}

bool DownloadThrottle::Pace(uint64_t sent_total, const std::function<bool()>& cancelled) {
  if (rate_ == 0) return !(cancelled && cancelled());

  const auto due = start_ + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                                std::chrono::duration<double>(static_cast<double>(sent_total) / static_cast<double>(rate_)));

  for (;;) {
    if (cancelled && cancelled()) return false;

    const auto now = std::chrono::steady_clock::now();
    if (now >= due) return true;

    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(due - now, kSleepSlice));
  }
}

} // namespace mirrorsync::agent
