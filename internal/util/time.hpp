#pragma once

#include <chrono>
#include <cstdint>

namespace bounty::util {

/*
  Time utilities — single place to control clock source later.

  Persisted timestamps are unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

inline int64_t NowMs() {
  return ToUnixMillis(Now());
}

} // namespace bounty::util
