#include <atomic>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "adapters/memory/InMemoryCache.hpp"
#include "app/DistributedLock.hpp"
#include "app/DurableWriter.hpp"
#include "app/InitialLoader.hpp"
#include "app/PollingScheduler.hpp"
#include "core/CacheKeys.hpp"
#include "core/CandleSeriesStore.hpp"
#include "indicators/IndicatorEngine.h"
#include "TestSupport.hpp"

namespace {

using testsupport::FakeBackend;
using testsupport::FakeClock;
using testsupport::FakeExchange;
using testsupport::makeCandle;
using testsupport::makeSeries;
using testsupport::RecordingSleeper;

constexpr std::int64_t kBase = 1704067200;
const std::string kSymbol = "BTC-USDT-SWAP";

// Routes each timeframe to its own scripted history.
class TimeframeExchange : public domain::IExchangeCandles {
public:
    std::map<int, FakeExchange> byMinutes;

    std::vector<domain::Candle> fetch_candles(const std::string& symbol,
                                              int minutes,
                                              std::size_t limit,
                                              std::optional<std::int64_t> since_ms = std::nullopt) override {
        return byMinutes[minutes].fetch_candles(symbol, minutes, limit, since_ms);
    }

    std::vector<domain::Candle> fetch_candles_before(const std::string& symbol,
                                                     int minutes,
                                                     std::size_t limit,
                                                     std::int64_t before_sec) override {
        return byMinutes[minutes].fetch_candles_before(symbol, minutes, limit, before_sec);
    }
};

indicators::IndicatorParams smallParams() {
    indicators::IndicatorParams params;
    params.minimumCandles = 30;
    return params;
}

struct Harness {
    adapters::memory::InMemoryCache cache;
    FakeExchange exchange;
    indicators::IndicatorEngine engine{smallParams()};
    FakeBackend backend;
    RecordingSleeper writerSleeper;
    FakeClock clock{kBase + 3};
    app::DurableWriter writer{backend, app::WriterOptions{}, writerSleeper.fn(), clock.fn()};
    core::CandleSeriesStore store{cache, exchange, engine, writer};
    app::DistributedLock lock{cache};

    Harness() {
        exchange.history = makeSeries(kBase - 60, 1, 40);
        auto current = makeCandle(kBase, 150.0);
        current.isCurrent = true;
        exchange.current = current;
        writer.initialize();
    }

    app::SchedulerOptions options() const {
        app::SchedulerOptions out;
        out.symbols = {kSymbol};
        out.timeframes = {1};
        out.pollingCandles = 10;
        return out;
    }
};

int testTickRunsBarEndThenCurrent() {
    Harness h;
    RecordingSleeper sleeper;
    app::PollingScheduler scheduler(h.store, h.exchange, h.lock, h.writer, h.cache, h.options(), h.clock.fn(),
                                    sleeper.fn());

    scheduler.tick();
    EXPECT_TRUE(!h.exchange.requestedLimits.empty() && h.exchange.requestedLimits.front() == 10,
                "bar-end unit should fetch the polling window");
    const auto raw = h.store.loadRaw(kSymbol, 1);
    EXPECT_TRUE(raw.size() == 39 && raw.back().timestamp == kBase - 60,
                "completed candles merged with top-up, size=" << raw.size());
    EXPECT_TRUE(!h.store.loadIndicators(kSymbol, 1).empty(), "indicators computed after the bar end");
    EXPECT_TRUE(!h.backend.written.empty() && h.backend.written.front().first == "btc_usdt",
                "computed rows mirrored to the durable store");
    EXPECT_TRUE(!h.cache.get(core::keys::current(kSymbol, 1)).has_value(), "bar-end tick does not refresh current");

    h.clock.now += 1;  // still inside the window, but within the cooldown
    scheduler.tick();
    EXPECT_TRUE(h.cache.get(core::keys::current(kSymbol, 1)).has_value(), "current unit should run next");

    const auto calls = h.exchange.fetchCalls;
    h.clock.now += 1;  // window closed and 1m refresh interval not yet due
    scheduler.tick();
    EXPECT_TRUE(h.exchange.fetchCalls == calls, "nothing due, no exchange traffic");

    h.clock.now += 2;
    scheduler.tick();
    EXPECT_TRUE(h.exchange.fetchCalls == calls + 1, "current refresh once the interval elapses");
    EXPECT_TRUE(!h.cache.get(app::DistributedLock::lockKey(kSymbol, 1, "current")).has_value(),
                "unit releases its lock");
    return 0;
}

int testLockedAndFailingUnits() {
    Harness h;
    RecordingSleeper sleeper;
    app::PollingScheduler scheduler(h.store, h.exchange, h.lock, h.writer, h.cache, h.options(), h.clock.fn(),
                                    sleeper.fn());

    app::ScopedLock other(h.lock, app::DistributedLock::lockKey(kSymbol, 1, "current"));
    EXPECT_TRUE(other.owned(), "another process holds the lock");
    EXPECT_TRUE(!scheduler.runUnit(kSymbol, 1, app::PollingScheduler::UnitKind::Current, h.clock.now),
                "held lock skips the unit");
    EXPECT_TRUE(h.exchange.fetchCalls == 0, "skipped unit does no work");

    h.exchange.failNext = true;
    EXPECT_TRUE(!scheduler.runUnit(kSymbol, 1, app::PollingScheduler::UnitKind::BarEnd, h.clock.now),
                "exchange failure is contained in the unit");
    EXPECT_TRUE(scheduler.runUnit(kSymbol, 1, app::PollingScheduler::UnitKind::BarEnd, h.clock.now),
                "next run recovers");
    return 0;
}

int testMaintenanceAndRunLoop() {
    Harness h;
    std::atomic<bool> stop{false};
    int sleeps = 0;
    auto sleeper = [&](std::chrono::milliseconds) {
        if (++sleeps == 2) {
            stop = true;
        }
    };
    app::PollingScheduler scheduler(h.store, h.exchange, h.lock, h.writer, h.cache, h.options(), h.clock.fn(),
                                    sleeper);

    scheduler.tick();
    const auto pings = h.backend.pingCalls;
    h.clock.now += 299;
    scheduler.tick();
    EXPECT_TRUE(h.backend.pingCalls == pings, "health check waits for its interval");
    h.clock.now += 1;
    scheduler.tick();
    EXPECT_TRUE(h.backend.pingCalls == pings + 1, "health check pings the durable store");

    scheduler.run(stop);
    EXPECT_TRUE(sleeps == 2, "loop checks the stop flag once per iteration");
    return 0;
}

int testCacheDiagnostics() {
    Harness h;
    RecordingSleeper sleeper;
    app::PollingScheduler scheduler(h.store, h.exchange, h.lock, h.writer, h.cache, h.options(), h.clock.fn(),
                                    sleeper.fn());

    EXPECT_TRUE(scheduler.cacheDiagnostics().heldLocks == 0, "no locks before any unit");
    app::ScopedLock held(h.lock, app::DistributedLock::lockKey(kSymbol, 1, "bar_end"));
    h.cache.set(core::keys::gaps(kSymbol, 1), "[]");
    const auto diagnostics = scheduler.cacheDiagnostics();
    EXPECT_TRUE(diagnostics.heldLocks == 1, "held lock is counted, got " << diagnostics.heldLocks);
    EXPECT_TRUE(diagnostics.gapMarkers == 1, "gap marker key is counted, got " << diagnostics.gapMarkers);
    return 0;
}

int testInitialLoadOrderAndAutoTrend() {
    adapters::memory::InMemoryCache cache;
    TimeframeExchange exchange;
    const auto end5m = kBase + 100 * 300;
    exchange.byMinutes[5].history = makeSeries(end5m, 5, 80);
    exchange.byMinutes[1].history = makeSeries(end5m + 4 * 60, 1, 80);
    indicators::IndicatorEngine engine{smallParams()};
    testsupport::RecordingSink sink;
    core::SeriesOptions options;
    options.maxLen = 50;
    core::CandleSeriesStore store(cache, exchange, engine, sink, options);
    app::DistributedLock lock(cache);

    app::InitialLoader loader(store, exchange, lock, {kSymbol}, {1, 5}, 10);
    EXPECT_TRUE(loader.order() == std::vector<int>({5, 1}), "coarser timeframes load first");

    std::atomic<bool> stop{false};
    EXPECT_TRUE(loader.run(stop) == 2, "both units should load");
    EXPECT_TRUE(exchange.byMinutes[5].requestedLimits.front() == 60, "load fetches max length plus warm-up");
    EXPECT_TRUE(store.loadRaw(kSymbol, 5).size() == 50, "raw series trimmed to max length");

    const auto rows = store.loadIndicators(kSymbol, 1);
    EXPECT_TRUE(rows.size() == 50, "warm-up rows are dropped, size=" << rows.size());
    EXPECT_TRUE(rows.back().indicators.autoTrendState == 2,
                "1m auto trend follows the rising 5m series, got " << rows.back().indicators.autoTrendState.value_or(99));
    const auto coarse = store.loadIndicators(kSymbol, 5);
    EXPECT_TRUE(coarse.back().indicators.autoTrendState == 0, "5m has no stored 30m series, so neutral");

    app::ScopedLock held(lock, app::DistributedLock::lockKey(kSymbol, 5, "initial"));
    EXPECT_TRUE(!loader.loadUnit(kSymbol, 5), "held lock skips the load");
    return 0;
}

}  // namespace

int main() {
    int failures = 0;
    failures += testTickRunsBarEndThenCurrent();
    failures += testLockedAndFailingUnits();
    failures += testMaintenanceAndRunLoop();
    failures += testCacheDiagnostics();
    failures += testInitialLoadOrderAndAutoTrend();
    if (failures != 0) {
        std::cerr << failures << " scheduling test(s) failed\n";
        return 1;
    }
    return 0;
}
