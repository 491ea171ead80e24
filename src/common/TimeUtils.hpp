#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace csync::common {

// Wall-clock source in epoch seconds. Components take one so tests can pin time.
using EpochClock = std::function<std::int64_t()>;

std::int64_t nowEpochSeconds();
EpochClock systemEpochClock();

// Sleep hook; tests substitute a recorder.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

Sleeper threadSleeper();

// "%Y-%m-%d %H:%M:%S" in UTC.
std::string formatUtc(std::int64_t epochSeconds);

// Same layout in Asia/Seoul (UTC+09:00, no daylight saving).
std::string formatSeoul(std::int64_t epochSeconds);

}  // namespace csync::common
