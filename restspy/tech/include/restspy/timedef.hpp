#pragma once

#include <chrono>

namespace restspy {

/// system_clock is only used for log time stamps. Anything measuring elapsed time (readiness polling, process
/// termination grace periods, socket timeouts) uses the monotonic steady_clock.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;

using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

}  // namespace restspy
