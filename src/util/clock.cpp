#include "util/clock.hpp"

#include <stdexcept>
#include <string>

namespace sessid::util {

TimeSource systemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

TimeSource fixedClock(const TimePoint tp) {
    return [tp] { return tp; };
}

TimePoint fromEpochSeconds(const uint64_t seconds) {
    return TimePoint{std::chrono::seconds(seconds)};
}

uint64_t epochSeconds(const TimePoint tp) {
    const auto secs = std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch()).count();
    if (secs < 0)
        throw std::runtime_error("Clock reports a time before the Unix epoch: " + std::to_string(secs) + "s");
    return static_cast<uint64_t>(secs);
}

uint64_t timeBucket(const TimePoint tp, const std::chrono::seconds granularity) {
    if (granularity.count() <= 0) throw std::invalid_argument("Time bucket granularity must be positive");
    return epochSeconds(tp) / static_cast<uint64_t>(granularity.count());
}

}
