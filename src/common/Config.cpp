#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "domain/Timeframe.hpp"

namespace csync::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::vector<std::string> parseCsvList(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto trimmed = trim(item);
        if (!trimmed.empty()) {
            parts.push_back(std::move(trimmed));
        }
    }
    return parts;
}

std::uint16_t parsePort(const std::string& value, const std::string& label) {
    try {
        const auto portValue = std::stoul(value);
        if (portValue == 0U || portValue > 65535U) {
            throw std::out_of_range("port out of range");
        }
        return static_cast<std::uint16_t>(portValue);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid port for " + label + ": " + value);
    }
}

std::size_t parseCount(const std::string& value, const std::string& label, bool allowZero) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size() || (!allowZero && parsed == 0U)) {
            throw std::out_of_range("count out of range");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::uint32_t parseDuration(const std::string& value, const std::string& label) {
    const auto parsed = parseCount(value, label, false);
    if (parsed > std::numeric_limits<std::uint32_t>::max()) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
    return static_cast<std::uint32_t>(parsed);
}

std::vector<int> parseTimeframes(const std::string& value) {
    std::vector<int> minutes;
    for (const auto& item : parseCsvList(value)) {
        int parsed = 0;
        try {
            // Accepts both "15" and "15m" / "1h".
            if (std::all_of(item.begin(), item.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
                parsed = std::stoi(item);
            } else {
                parsed = domain::timeframe::toMinutes(toLower(item));
            }
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid timeframe: " + item);
        }
        if (!domain::timeframe::isKnown(parsed)) {
            throw std::runtime_error("Unsupported timeframe: " + item);
        }
        if (std::find(minutes.begin(), minutes.end(), parsed) == minutes.end()) {
            minutes.push_back(parsed);
        }
    }
    return minutes;
}

std::string parseCacheKind(const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (normalized == "redis" || normalized == "memory") {
        return normalized;
    }
    throw std::runtime_error("Invalid cache backend: " + value);
}

bool parseBool(const std::string& value) {
    const auto normalized = toLower(value);
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw std::runtime_error("Invalid boolean value: " + value);
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

bool hasFlag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (key == argv[i]) {
            return true;
        }
    }
    return false;
}

// Environment first, command line second; the last non-empty source wins.
std::string lookup(int argc, char** argv, const char* envName, const std::string& flag) {
    if (auto fromArgs = valueFromArgs(argc, argv, flag); !fromArgs.empty()) {
        return fromArgs;
    }
    if (const char* fromEnv = std::getenv(envName)) {
        return trim(fromEnv);
    }
    return {};
}

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (auto value = lookup(argc, argv, "LOG_LEVEL", "--log-level"); !value.empty()) {
        config.logLevel = csync::log::levelFromString(toLower(value));
    }
    if (auto value = lookup(argc, argv, "SYMBOLS", "--symbols"); !value.empty()) {
        config.symbols = parseCsvList(value);
        for (auto& symbol : config.symbols) {
            std::transform(symbol.begin(), symbol.end(), symbol.begin(), [](unsigned char c) {
                return static_cast<char>(std::toupper(c));
            });
        }
    }
    if (auto value = lookup(argc, argv, "TIMEFRAMES", "--timeframes"); !value.empty()) {
        config.timeframes = parseTimeframes(value);
    }
    if (auto value = lookup(argc, argv, "MAX_CANDLE_LEN", "--max-len"); !value.empty()) {
        config.maxCandleLen = parseCount(value, "MAX_CANDLE_LEN", false);
    }
    if (auto value = lookup(argc, argv, "WARMUP_CANDLES", "--warmup"); !value.empty()) {
        config.warmUpCandles = parseCount(value, "WARMUP_CANDLES", true);
    }
    if (auto value = lookup(argc, argv, "MIN_CANDLES_FOR_INDICATORS", "--min-candles"); !value.empty()) {
        config.minCandlesForIndicators = parseCount(value, "MIN_CANDLES_FOR_INDICATORS", false);
    }
    if (auto value = lookup(argc, argv, "POLLING_CANDLES", "--polling-candles"); !value.empty()) {
        config.pollingCandles = parseCount(value, "POLLING_CANDLES", false);
    }
    if (auto value = lookup(argc, argv, "GAP_BACKFILL_CAP", "--gap-cap"); !value.empty()) {
        config.gapBackfillCap = parseCount(value, "GAP_BACKFILL_CAP", false);
    }
    if (auto value = lookup(argc, argv, "POLL_INTERVAL_MS", "--poll-interval-ms"); !value.empty()) {
        config.pollIntervalMs = parseDuration(value, "POLL_INTERVAL_MS");
    }
    if (auto value = lookup(argc, argv, "LOCK_TTL_MS", "--lock-ttl-ms"); !value.empty()) {
        config.lockTtlMs = parseDuration(value, "LOCK_TTL_MS");
    }
    if (auto value = lookup(argc, argv, "WS_SAVE_INTERVAL_S", "--ws-save-interval"); !value.empty()) {
        config.wsSaveIntervalSec = parseDuration(value, "WS_SAVE_INTERVAL_S");
    }
    if (auto value = lookup(argc, argv, "HEALTH_CHECK_INTERVAL_S", "--health-check-interval"); !value.empty()) {
        config.healthCheckIntervalSec = parseDuration(value, "HEALTH_CHECK_INTERVAL_S");
    }
    if (auto value = lookup(argc, argv, "WRITER_MAX_RETRIES", "--writer-max-retries"); !value.empty()) {
        config.writerMaxRetries = static_cast<std::uint32_t>(parseCount(value, "WRITER_MAX_RETRIES", true));
    }
    if (auto value = lookup(argc, argv, "WRITER_BASE_DELAY_MS", "--writer-base-delay-ms"); !value.empty()) {
        config.writerBaseDelayMs = parseDuration(value, "WRITER_BASE_DELAY_MS");
    }
    if (auto value = lookup(argc, argv, "WRITER_POOL_MIN", "--writer-pool-min"); !value.empty()) {
        config.writerPoolMin = parseCount(value, "WRITER_POOL_MIN", false);
    }
    if (auto value = lookup(argc, argv, "WRITER_POOL_MAX", "--writer-pool-max"); !value.empty()) {
        config.writerPoolMax = parseCount(value, "WRITER_POOL_MAX", false);
    }
    if (auto value = lookup(argc, argv, "PAGE_DELAY_MS", "--page-delay-ms"); !value.empty()) {
        config.pageDelayMs = static_cast<std::uint32_t>(parseCount(value, "PAGE_DELAY_MS", true));
    }
    if (auto value = lookup(argc, argv, "WS_HEARTBEAT_S", "--ws-heartbeat"); !value.empty()) {
        config.wsHeartbeatSec = parseDuration(value, "WS_HEARTBEAT_S");
    }
    if (auto value = lookup(argc, argv, "WS_STATUS_S", "--ws-status"); !value.empty()) {
        config.wsStatusSec = parseDuration(value, "WS_STATUS_S");
    }
    if (auto value = lookup(argc, argv, "WS_RECONNECT_COOLDOWN_S", "--ws-reconnect-cooldown"); !value.empty()) {
        config.wsReconnectCooldownSec = parseDuration(value, "WS_RECONNECT_COOLDOWN_S");
    }
    if (auto value = lookup(argc, argv, "DUCKDB_PATH", "--duckdb"); !value.empty()) {
        config.duckdbPath = value;
    }
    if (auto value = lookup(argc, argv, "CACHE", "--cache"); !value.empty()) {
        config.cache = parseCacheKind(value);
    }
    if (auto value = lookup(argc, argv, "REDIS_HOST", "--redis-host"); !value.empty()) {
        config.redisHost = value;
    }
    if (auto value = lookup(argc, argv, "REDIS_PORT", "--redis-port"); !value.empty()) {
        config.redisPort = parsePort(value, "REDIS_PORT");
    }
    if (const char* envPassword = std::getenv("REDIS_PASSWORD")) {
        config.redisPassword = envPassword;
    }
    if (auto value = lookup(argc, argv, "ENABLE_STREAM", "--stream"); !value.empty()) {
        config.stream = parseBool(value);
    }

    if (hasFlag(argc, argv, "--no-stream")) {
        config.stream = false;
    }
    if (hasFlag(argc, argv, "--no-poll")) {
        config.poll = false;
    }
    if (hasFlag(argc, argv, "--no-initial-load")) {
        config.initialLoad = false;
    }

    if (config.symbols.empty()) {
        throw std::runtime_error("At least one symbol is required");
    }
    if (config.timeframes.empty()) {
        throw std::runtime_error("At least one timeframe is required");
    }
    if (config.cache == "redis" && config.redisHost.empty()) {
        throw std::runtime_error("REDIS_HOST is required when the redis cache is selected");
    }
    if (config.duckdbPath.empty()) {
        throw std::runtime_error("DUCKDB_PATH must not be empty");
    }
    if (config.writerPoolMin > config.writerPoolMax) {
        config.writerPoolMin = config.writerPoolMax;
    }

    const std::filesystem::path duckPath{config.duckdbPath};
    const auto parentDir = duckPath.parent_path();
    if (!parentDir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parentDir, ec);
        if (ec) {
            throw std::runtime_error("Unable to create DuckDB directory (" + parentDir.string() + "): " +
                                     ec.message());
        }
    }

    LOG_INFO("DuckDB path: " << duckPath.string());

    return config;
}

}  // namespace csync::common
