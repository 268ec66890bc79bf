#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace mm {

using TimePoint = std::chrono::system_clock::time_point;
using ClockFn = std::function<TimePoint()>;

inline TimePoint system_now() {
    return std::chrono::system_clock::now();
}

inline double seconds_between(TimePoint from, TimePoint to) {
    return std::chrono::duration<double>(to - from).count();
}

long long to_epoch_ms(TimePoint time);

TimePoint from_epoch_ms(long long epoch_ms);

// YYYY-MM-DD in UTC.
std::string utc_date(TimePoint time);

std::string utc_timestamp(TimePoint time);

} // namespace mm
