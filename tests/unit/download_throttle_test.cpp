#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>

#include "internal/agent/download_throttle.hpp"

namespace {

using mirrorsync::agent::DownloadThrottle;
using Clock = std::chrono::steady_clock;

void TestChunkSizing() {
  assert(DownloadThrottle(0).ChunkSize() == DownloadThrottle::kMaxChunk);
  assert(DownloadThrottle(0).Unlimited());
  assert(DownloadThrottle(5'000).ChunkSize() == DownloadThrottle::kMinChunk);
  assert(DownloadThrottle(200'000).ChunkSize() == 20'000);
  assert(DownloadThrottle(100'000'000).ChunkSize() == DownloadThrottle::kMaxChunk);
}

void TestSustainedRateStaysWithinTenPercent() {
  constexpr uint64_t kRate  = 200'000;
  constexpr uint64_t kTotal = 3 * kRate;

  DownloadThrottle throttle(kRate);
  const auto       started = Clock::now();

  uint64_t sent = 0;
  while (sent < kTotal) {
    sent += throttle.ChunkSize();
    assert(throttle.Pace(sent, {}));
  }

  const double seconds = std::chrono::duration<double>(Clock::now() - started).count();
  const double rate    = static_cast<double>(sent) / seconds;
  assert(rate <= kRate * 1.10);
  assert(rate >= kRate * 0.90);
}

void TestUnlimitedNeverSleeps() {
  DownloadThrottle throttle(0);
  const auto       started = Clock::now();
  for (uint64_t sent = 0; sent < (1u << 30); sent += DownloadThrottle::kMaxChunk) {
    assert(throttle.Pace(sent, {}));
  }
  assert(Clock::now() - started < std::chrono::seconds(1));
  assert(!throttle.Pace(0, [] { return true; }));
}

void TestCancellationInterruptsSleep() {
  DownloadThrottle throttle(1'024);
  const auto       started = Clock::now();

  // ten seconds of budget, cancelled after a fifth of a second
  const bool finished = throttle.Pace(10 * 1'024, [&] { return Clock::now() - started > std::chrono::milliseconds(200); });
  assert(!finished);
  assert(Clock::now() - started < std::chrono::seconds(1));
}

} // namespace

int main() {
  TestChunkSizing();
  TestSustainedRateStaysWithinTenPercent();
  TestUnlimitedNeverSleeps();
  TestCancellationInterruptsSleep();

  std::cout << "download_throttle_test: pass\n";
  return 0;
}
