#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "adapters/duckdb/DuckCandleStore.hpp"
#include "adapters/memory/InMemoryCache.hpp"
#include "adapters/okx/OkxRestClient.hpp"
#include "adapters/okx/OkxStreamHandler.hpp"
#include "adapters/okx/OkxWsClient.hpp"
#include "adapters/redis/RedisCache.hpp"
#include "app/DistributedLock.hpp"
#include "app/DurableWriter.hpp"
#include "app/InitialLoader.hpp"
#include "app/PollingScheduler.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "core/CandleSeriesStore.hpp"
#include "domain/Timeframe.hpp"
#include "indicators/IndicatorEngine.h"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
}

std::string joinList(const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (joined.empty()) {
            joined = value;
        } else {
            joined.append(",").append(value);
        }
    }
    return joined;
}

std::string joinTimeframes(const std::vector<int>& minutes) {
    std::vector<std::string> codes;
    codes.reserve(minutes.size());
    for (int m : minutes) {
        codes.push_back(domain::timeframe::toCode(m));
    }
    return joinList(codes);
}

std::unique_ptr<domain::ICacheStore> makeCache(const csync::common::Config& config) {
    if (config.cache == "memory") {
        LOG_WARN("using in-process cache; locks and series are not shared across processes");
        return std::make_unique<adapters::memory::InMemoryCache>();
    }
    adapters::redis::RedisOptions options;
    options.host = config.redisHost;
    options.port = config.redisPort;
    options.password = config.redisPassword;
    return std::make_unique<adapters::redis::RedisCache>(std::move(options));
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        if (auto eptr = std::current_exception()) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& ex) {
                std::fprintf(stderr, "std::terminate: %s\n", ex.what());
            } catch (...) {
                std::fprintf(stderr, "std::terminate: unknown exception\n");
            }
        } else {
            std::fprintf(stderr, "std::terminate without current_exception\n");
        }
        std::_Exit(1);
    });

    try {
        const auto config = csync::common::Config::fromArgs(argc, argv);
        csync::log::setLevel(config.logLevel);

        LOG_INFO("configuration loaded");
        LOG_INFO("  symbols: " << joinList(config.symbols));
        LOG_INFO("  timeframes: " << joinTimeframes(config.timeframes));
        LOG_INFO("  window: max=" << config.maxCandleLen << " warm_up=" << config.warmUpCandles
                                  << " min_for_indicators=" << config.minCandlesForIndicators);
        LOG_INFO("  cache: " << config.cache);
        LOG_INFO("  duckdb: " << config.duckdbPath << " pool=" << config.writerPoolMin << ".."
                              << config.writerPoolMax);
        LOG_INFO("  stream=" << config.stream << " poll=" << config.poll << " initial_load=" << config.initialLoad);

        auto cache = makeCache(config);
        if (!cache->ping()) {
            LOG_WARN("cache did not answer PING at startup");
        }

        adapters::duckdb::DuckCandleStore backend(config.duckdbPath,
                                                  adapters::duckdb::DuckPoolOptions{config.writerPoolMin,
                                                                                    config.writerPoolMax});
        app::WriterOptions writerOptions;
        writerOptions.maxRetries = static_cast<int>(config.writerMaxRetries);
        writerOptions.baseDelay = std::chrono::milliseconds(config.writerBaseDelayMs);
        writerOptions.healthCheckInterval = std::chrono::seconds(config.healthCheckIntervalSec);
        app::DurableWriter writer(backend, writerOptions);
        if (!writer.initialize()) {
            LOG_WARN("durable store unavailable, continuing with cache only");
        }

        adapters::okx::OkxRestOptions restOptions;
        restOptions.pageDelay = std::chrono::milliseconds(config.pageDelayMs);
        adapters::okx::OkxRestClient exchange(restOptions);

        indicators::IndicatorParams params;
        params.minimumCandles = config.minCandlesForIndicators;
        indicators::IndicatorEngine engine(params);

        core::SeriesOptions seriesOptions;
        seriesOptions.maxLen = config.maxCandleLen;
        seriesOptions.gapBackfillCap = config.gapBackfillCap;
        core::CandleSeriesStore store(*cache, exchange, engine, writer, seriesOptions);

        app::DistributedLock lock(*cache, std::chrono::milliseconds(config.lockTtlMs));

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        std::unique_ptr<adapters::okx::OkxStreamHandler> streamHandler;
        std::unique_ptr<adapters::okx::OkxWsClient> wsClient;
        if (config.stream) {
            streamHandler = std::make_unique<adapters::okx::OkxStreamHandler>(
                *cache, config.symbols, config.timeframes, std::chrono::seconds(config.wsSaveIntervalSec));
            adapters::okx::OkxWsOptions wsOptions;
            wsOptions.heartbeat = std::chrono::seconds(config.wsHeartbeatSec);
            wsOptions.statusInterval = std::chrono::seconds(config.wsStatusSec);
            wsOptions.reconnectCooldown = std::chrono::seconds(config.wsReconnectCooldownSec);
            wsClient = std::make_unique<adapters::okx::OkxWsClient>(*streamHandler, wsOptions);
            wsClient->start();
        }

        std::atomic<bool> stop{false};
        std::thread poller;
        if (config.initialLoad || config.poll) {
            poller = std::thread([&] {
                if (config.initialLoad) {
                    csync::log::setThreadName("loader");
                    app::InitialLoader loader(store, exchange, lock, config.symbols, config.timeframes,
                                              config.warmUpCandles);
                    loader.run(stop);
                }
                if (config.poll) {
                    app::SchedulerOptions schedulerOptions;
                    schedulerOptions.symbols = config.symbols;
                    schedulerOptions.timeframes = config.timeframes;
                    schedulerOptions.pollingCandles = config.pollingCandles;
                    schedulerOptions.pollInterval = std::chrono::milliseconds(config.pollIntervalMs);
                    app::PollingScheduler scheduler(store, exchange, lock, writer, *cache, schedulerOptions);
                    scheduler.run(stop);
                }
            });
        }

        LOG_INFO("sync engine running");
        while (gSignalStatus == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        LOG_INFO("signal " << gSignalStatus << " received, stopping");
        stop.store(true, std::memory_order_release);
        if (wsClient) {
            wsClient->stop();
        }
        if (poller.joinable()) {
            poller.join();
        }
        writer.logStats();
        writer.shutdown();

        LOG_INFO("shutdown complete");
    } catch (const std::exception& ex) {
        LOG_ERR("fatal error: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
