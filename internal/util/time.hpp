#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace mirrorsync::util {

/*
  Time utilities. Single place to control the clock source.

  Persisted timestamps are unix milliseconds; 0 means "never".
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// Wall-clock unix milliseconds. Components take a MillisClock so tests can
// drive time by hand.
using MillisClock = std::function<uint64_t()>;

uint64_t NowMillis();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

google::protobuf::Timestamp MillisToProto(uint64_t ms);

// Falls back to `fallback` when the duration is unset or non-positive.
std::chrono::milliseconds DurationOr(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);

} // namespace mirrorsync::util
