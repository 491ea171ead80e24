#include "adapters/okx/OkxBarMap.hpp"

namespace adapters::okx {

namespace {
constexpr std::string_view kChannelPrefix = "candle";
}

std::string okx_bar(int minutes) {
    return std::string(detail::okx_bar_literal(minutes));
}

int from_okx_bar(std::string_view bar) {
    return detail::from_okx_bar_literal(bar);
}

std::string okx_channel(int minutes) {
    return std::string(kChannelPrefix) + okx_bar(minutes);
}

int from_okx_channel(std::string_view channel) {
    if (channel.substr(0, kChannelPrefix.size()) != kChannelPrefix) {
        throw std::invalid_argument("Not a candle channel: " + std::string(channel));
    }
    return from_okx_bar(channel.substr(kChannelPrefix.size()));
}

}  // namespace adapters::okx
