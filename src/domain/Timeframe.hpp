#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace domain::timeframe {

struct Entry {
    int minutes;
    std::string_view code;
};

inline constexpr std::array<Entry, 10> kRegistry{{
    {1, "1m"},
    {3, "3m"},
    {5, "5m"},
    {15, "15m"},
    {30, "30m"},
    {60, "1h"},
    {240, "4h"},
    {360, "6h"},
    {720, "12h"},
    {1440, "1d"},
}};

namespace detail {

constexpr std::string_view known_code(int minutes) {
    for (const auto& entry : kRegistry) {
        if (entry.minutes == minutes) {
            return entry.code;
        }
    }
    return {};
}

constexpr int known_minutes(std::string_view code) {
    for (const auto& entry : kRegistry) {
        if (entry.code == code) {
            return entry.minutes;
        }
    }
    return 0;
}

}  // namespace detail

static_assert(detail::known_code(1) == std::string_view{"1m"});
static_assert(detail::known_code(240) == std::string_view{"4h"});
static_assert(detail::known_minutes("1d") == 1440);
static_assert(detail::known_minutes("15m") == 15);

bool isKnown(int minutes) noexcept;

// Registry code for minutes. Values outside the registry fall back to a
// derived "<N>h" code (or "<N>m" when minutes is not a whole hour).
std::string toCode(int minutes);

// Inverse of toCode. Accepts derived codes ("2h", "7m", "2d") as well.
// Throws std::invalid_argument for anything else.
int toMinutes(std::string_view code);

constexpr std::int64_t intervalSeconds(int minutes) noexcept {
    return static_cast<std::int64_t>(minutes) * 60;
}

// Floors a millisecond timestamp to the start of its bucket, in seconds.
std::int64_t align(std::int64_t timestampMs, int minutes);

bool isAligned(std::int64_t timestampSec, int minutes) noexcept;

// Durable-store timeframe label: 1 -> "1m", 60 -> "1h", 240 -> "4h", 1440 -> "1d".
std::string convert_timeframe(int minutes);

// "BTC-USDT-SWAP" -> "btc_usdt".
std::string normalize_symbol(std::string_view symbol);

// Timeframe whose trend feeds auto_trend_state for minutes.
int coarserTimeframe(int minutes) noexcept;

// Refresh cadence of the in-progress candle between bar boundaries.
std::chrono::seconds refreshInterval(int minutes) noexcept;

// True inside [2s, 5s) after a bucket boundary, when the exchange has
// published the closed candle.
bool isBarEndWindow(std::int64_t nowSec, int minutes) noexcept;

}  // namespace domain::timeframe
