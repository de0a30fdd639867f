#pragma once

#include <chrono>
#include <cstdint>

namespace research::util {

/*
  Time utilities. All persisted timestamps are unix milliseconds, 0 = unset.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMillis();

// now + seconds, in unix milliseconds
uint64_t MillisAfter(uint64_t base_ms, uint64_t seconds);

// Whole seconds from now_ms until target_ms, rounded up, 0 if already due.
uint64_t SecondsUntil(uint64_t now_ms, uint64_t target_ms);

} // namespace research::util
