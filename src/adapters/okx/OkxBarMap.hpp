#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace adapters::okx {

// OKX bar literal for a timeframe in minutes ("1m", "1H", "1D", ...).
std::string okx_bar(int minutes);
int from_okx_bar(std::string_view bar);

// Streaming channel name: "candle" + bar.
std::string okx_channel(int minutes);
// Inverse of okx_channel; throws std::invalid_argument for non-candle channels.
int from_okx_channel(std::string_view channel);

namespace detail {

constexpr std::string_view okx_bar_literal(int minutes) {
    switch (minutes) {
    case 1:
        return "1m";
    case 3:
        return "3m";
    case 5:
        return "5m";
    case 15:
        return "15m";
    case 30:
        return "30m";
    case 60:
        return "1H";
    case 240:
        return "4H";
    case 360:
        return "6H";
    case 720:
        return "12H";
    case 1440:
        return "1D";
    }
    throw std::invalid_argument("Unsupported OKX timeframe");
}

constexpr int from_okx_bar_literal(std::string_view bar) {
    for (int minutes : {1, 3, 5, 15, 30, 60, 240, 360, 720, 1440}) {
        if (okx_bar_literal(minutes) == bar) {
            return minutes;
        }
    }
    throw std::invalid_argument("Unsupported OKX bar");
}

}  // namespace detail

static_assert(detail::okx_bar_literal(60) == std::string_view{"1H"});
static_assert(detail::okx_bar_literal(1440) == std::string_view{"1D"});
static_assert(detail::from_okx_bar_literal("4H") == 240);
static_assert(detail::from_okx_bar_literal("15m") == 15);

}  // namespace adapters::okx
