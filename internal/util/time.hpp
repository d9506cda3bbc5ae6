#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace projmem::util {

/*
  Time utilities. Wall clock only; callers needing a fake clock inject one.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// 2026-01-31T12:00:00.123Z
std::string ToIso8601(TimePoint tp);

} // namespace projmem::util
