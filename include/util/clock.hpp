#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace zipline {

using WallClock = std::chrono::system_clock;
using TimePoint = WallClock::time_point;

// Injectable wall clock; tests substitute a manual one.
using ClockFn = std::function<TimePoint()>;

inline ClockFn SystemClock() {
    return [] { return WallClock::now(); };
}

inline std::int64_t ToUnixSeconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

inline TimePoint FromUnixSeconds(std::int64_t secs) {
    return TimePoint(std::chrono::seconds(secs));
}

} // namespace zipline
