#pragma once

#include <chrono>

namespace rangeserve {

/// The main clock is system_clock as it is the only one guaranteed to provide conversions to Unix epoch time.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

inline constexpr SysTimePoint kInvalidTimePoint = SysTimePoint::min();

}  // namespace rangeserve
