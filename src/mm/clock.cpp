#include "mm/clock.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace mm {
namespace {

std::tm to_utc_tm(TimePoint time) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    return utc;
}

} // namespace

long long to_epoch_ms(TimePoint time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

TimePoint from_epoch_ms(long long epoch_ms) {
    return TimePoint{std::chrono::milliseconds(epoch_ms)};
}

std::string utc_date(TimePoint time) {
    const auto utc = to_utc_tm(time);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%d");
    return oss.str();
}

std::string utc_timestamp(TimePoint time) {
    const auto utc = to_utc_tm(time);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace mm
