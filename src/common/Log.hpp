#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace csync::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

// Names the calling thread in every line it logs ("poller", "stream", ...).
// An empty name falls back to the numeric thread id.
void setThreadName(std::string name);

// Streams as "symbol=<s> tf=<code>" so unit-of-work lines share one shape.
struct UnitTag {
    std::string_view symbol;
    std::string_view timeframe;
};

std::ostream& operator<<(std::ostream& os, const UnitTag& tag);

}  // namespace csync::log

#define CSYNC_LOG_IMPL(level, expr)                                                        \
    do {                                                                                   \
        if (::csync::log::shouldLog(level)) {                                              \
            std::ostringstream csync_log_stream__;                                         \
            csync_log_stream__ << expr;                                                    \
            ::csync::log::log(level, csync_log_stream__.str());                            \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) CSYNC_LOG_IMPL(::csync::log::Level::Debug, expr)
#define LOG_INFO(expr) CSYNC_LOG_IMPL(::csync::log::Level::Info, expr)
#define LOG_WARN(expr) CSYNC_LOG_IMPL(::csync::log::Level::Warn, expr)
#define LOG_ERR(expr) CSYNC_LOG_IMPL(::csync::log::Level::Error, expr)
