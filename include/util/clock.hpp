#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace sessid::util {

using TimePoint = std::chrono::system_clock::time_point;
using TimeSource = std::function<TimePoint()>;

TimeSource systemClock();

// Always reports the same instant. For tests and reproducible tooling.
TimeSource fixedClock(TimePoint tp);

TimePoint fromEpochSeconds(uint64_t seconds);

// Whole seconds since the Unix epoch. A reading before the epoch means the
// clock is unusable and throws std::runtime_error.
uint64_t epochSeconds(TimePoint tp);

// Number of completed intervals of `granularity` since the epoch.
uint64_t timeBucket(TimePoint tp, std::chrono::seconds granularity);

}
