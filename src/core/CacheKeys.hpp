#pragma once

#include <string>
#include <string_view>

#include "domain/Timeframe.hpp"

namespace core::keys {

inline constexpr std::string_view kWebsocketStatus = "websocket_status";

inline std::string compose(std::string_view prefix, const std::string& symbol, int minutes) {
    std::string key;
    key.reserve(prefix.size() + symbol.size() + 6);
    key.append(prefix).append(":").append(symbol).append(":").append(domain::timeframe::toCode(minutes));
    return key;
}

inline std::string raw(const std::string& symbol, int minutes) {
    return compose("candles", symbol, minutes);
}

inline std::string indicators(const std::string& symbol, int minutes) {
    return compose("candles_with_indicators", symbol, minutes);
}

inline std::string current(const std::string& symbol, int minutes) {
    return compose("current_candle", symbol, minutes);
}

inline std::string latest(const std::string& symbol, int minutes) {
    return compose("latest", symbol, minutes);
}

inline std::string currentWithIndicators(const std::string& symbol, int minutes) {
    return compose("current_candle_with_indicators", symbol, minutes);
}

inline std::string latestWithIndicators(const std::string& symbol, int minutes) {
    return compose("latest_with_indicators", symbol, minutes);
}

inline std::string gaps(const std::string& symbol, int minutes) {
    return compose("gaps", symbol, minutes);
}

}  // namespace core::keys
