#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace notewatch::util {

/*
  Time utilities. Wall clock for note timestamps, steady clock for
  deadlines and debounce windows.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using SteadyClock     = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// RFC 3339 in UTC, second precision: 2024-05-01T09:30:00Z
std::string FormatTimestamp(TimePoint tp);

} // namespace notewatch::util
