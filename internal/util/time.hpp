#pragma once

#include <chrono>
#include <cstdint>

namespace chunkstore::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// Index timestamps are unix nanoseconds.
int64_t NowUnixNanos();

int64_t ToUnixNanos(TimePoint tp);

} // namespace chunkstore::util
