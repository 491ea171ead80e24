#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "common/Log.hpp"

namespace csync::common {

struct Config {
    csync::log::Level logLevel = csync::log::Level::Info;

    std::vector<std::string> symbols{"BTC-USDT-SWAP", "ETH-USDT-SWAP", "SOL-USDT-SWAP"};
    std::vector<int> timeframes{1, 3, 5, 15, 30, 60, 240};

    std::size_t maxCandleLen = 3000;
    std::size_t warmUpCandles = 199;
    std::size_t minCandlesForIndicators = 199;
    std::size_t pollingCandles = 10;
    std::size_t gapBackfillCap = 1000;
    std::uint32_t pollIntervalMs = 1000;
    std::uint32_t pageDelayMs = 500;
    std::uint32_t lockTtlMs = 30000;

    std::uint32_t wsSaveIntervalSec = 5;
    std::uint32_t wsHeartbeatSec = 20;
    std::uint32_t wsStatusSec = 300;
    std::uint32_t wsReconnectCooldownSec = 5;

    std::uint32_t healthCheckIntervalSec = 60;
    std::uint32_t writerMaxRetries = 3;
    std::uint32_t writerBaseDelayMs = 1000;
    std::size_t writerPoolMin = 1;
    std::size_t writerPoolMax = 10;
    std::string duckdbPath = "data/candles.duckdb";

    std::string cache = "redis";
    std::string redisHost = "127.0.0.1";
    std::uint16_t redisPort = 6379;
    std::string redisPassword;

    bool stream = true;
    bool poll = true;
    bool initialLoad = true;

    static Config fromArgs(int argc, char** argv);
};

}  // namespace csync::common
