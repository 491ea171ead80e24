#include "common/TimeUtils.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace csync::common {
namespace {

constexpr std::int64_t kSeoulOffsetSec = 9 * 3600;

std::string formatGm(std::int64_t epochSeconds) {
    const auto time = static_cast<std::time_t>(epochSeconds);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

}  // namespace

std::int64_t nowEpochSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

EpochClock systemEpochClock() {
    return [] { return nowEpochSeconds(); };
}

Sleeper threadSleeper() {
    return [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
}

std::string formatUtc(std::int64_t epochSeconds) {
    return formatGm(epochSeconds);
}

std::string formatSeoul(std::int64_t epochSeconds) {
    return formatGm(epochSeconds + kSeoulOffsetSec);
}

}  // namespace csync::common
