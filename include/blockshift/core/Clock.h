#pragma once

#include <chrono>
#include <functional>

namespace blockshift {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/// Time source used by the engine; tests inject a fake one
using ClockFn = std::function<TimePoint()>;

inline ClockFn steadyClock() {
    return [] { return Clock::now(); };
}

}  // namespace blockshift
