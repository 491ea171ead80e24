#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "common/TimeUtils.hpp"
#include "domain/Candle.hpp"
#include "domain/Ports.hpp"

namespace adapters::okx {

// Transport-free half of the OKX candle stream: builds the (un)subscribe
// frames, decodes pushes, counts them per channel and throttles writes of
// the "latest" slots per symbol.
class OkxStreamHandler {
public:
    using ChannelKey = std::pair<std::string, std::string>;  // (instId, channel)

    OkxStreamHandler(domain::ICacheStore& cache,
                     std::vector<std::string> symbols,
                     std::vector<int> timeframes,
                     std::chrono::seconds saveInterval,
                     csync::common::EpochClock clock = csync::common::systemEpochClock());

    std::string subscribeMessage() const;
    std::string unsubscribeMessage() const;

    // Returns true when the frame carried a candle push.
    bool handleMessage(std::string_view payload);

    // Logs the per-channel counters and resets them.
    void reportStatus();

    void setConnectionStatus(bool connected);

    std::map<ChannelKey, std::uint64_t> counts() const;
    std::size_t channelCount() const noexcept { return symbols_.size() * timeframes_.size(); }

private:
    std::string argsMessage_(std::string_view op) const;
    void flushLatest_(const std::string& symbol, std::int64_t now);

    domain::ICacheStore& cache_;
    std::vector<std::string> symbols_;
    std::vector<int> timeframes_;
    std::chrono::seconds saveInterval_;
    csync::common::EpochClock clock_;

    mutable std::mutex mutex_;
    std::map<ChannelKey, std::uint64_t> counts_;
    std::unordered_map<std::string, std::int64_t> lastSave_;
    // Newest push per (symbol, minutes) since the last flush.
    std::map<std::pair<std::string, int>, domain::Candle> pending_;
};

}  // namespace adapters::okx
