#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace srepl::util {

/*
  Time utilities. Single place that owns the clock source.
*/

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

TimePoint Now();

uint64_t MillisBetween(TimePoint earlier, TimePoint later);

} // namespace srepl::util
