#include <algorithm>
#include <iostream>
#include <set>
#include <string>

#include "adapters/memory/InMemoryCache.hpp"
#include "core/CacheKeys.hpp"
#include "core/CandleCodec.hpp"
#include "core/CandleSeriesStore.hpp"
#include "indicators/IndicatorEngine.h"
#include "TestSupport.hpp"

namespace {

using testsupport::FakeExchange;
using testsupport::makeCandle;
using testsupport::makeSeries;
using testsupport::RecordingSink;

constexpr std::int64_t kBase = 1704067200;  // 2024-01-01 00:00:00 UTC
const std::string kSymbol = "BTC-USDT-SWAP";

indicators::IndicatorParams smallParams() {
    indicators::IndicatorParams params;
    params.minimumCandles = 30;
    return params;
}

struct Fixture {
    adapters::memory::InMemoryCache cache;
    FakeExchange exchange;
    indicators::IndicatorEngine engine{smallParams()};
    RecordingSink sink;
    core::CandleSeriesStore store;

    explicit Fixture(core::SeriesOptions options = {})
        : store(cache, exchange, engine, sink, options) {}
};

int testLastWriteWins() {
    Fixture f;
    const auto ts = kBase + 3600;
    f.store.merge(kSymbol, 60, {makeCandle(ts, 10.0)});
    f.store.merge(kSymbol, 60, {makeCandle(ts, 20.0)});
    const auto series = f.store.loadRaw(kSymbol, 60);
    EXPECT_TRUE(series.size() == 1, "re-merging a timestamp must not grow the series, size=" << series.size());
    EXPECT_TRUE(series.front().close == 20.0, "newer write should win, close=" << series.front().close);
    return 0;
}

int testOutOfOrderInput() {
    Fixture f;
    const auto t1 = kBase;
    const auto t2 = kBase + 3600;
    const auto t3 = kBase + 7200;
    f.store.merge(kSymbol, 60, {makeCandle(t3, 3.0), makeCandle(t1, 1.0), makeCandle(t2, 2.0)});
    const auto series = f.store.loadRaw(kSymbol, 60);
    EXPECT_TRUE(series.size() == 3, "expected three candles, got " << series.size());
    EXPECT_TRUE(series[0].timestamp == t1 && series[1].timestamp == t2 && series[2].timestamp == t3,
                "stored series must be ascending");
    return 0;
}

int testRejectsCurrentAndUnaligned() {
    Fixture f;
    auto current = makeCandle(kBase + 300, 5.0);
    current.isCurrent = true;
    f.store.merge(kSymbol, 5, {makeCandle(kBase, 4.0), current, makeCandle(kBase + 17, 6.0)});
    const auto series = f.store.loadRaw(kSymbol, 5);
    EXPECT_TRUE(series.size() == 1 && series.front().timestamp == kBase,
                "only the completed aligned candle should be stored, size=" << series.size());
    return 0;
}

int testTrimToMaxLen() {
    core::SeriesOptions options;
    options.maxLen = 50;
    Fixture f(options);
    const auto incoming = makeSeries(kBase + 79 * 60, 1, 80);
    const auto window = f.store.merge(kSymbol, 1, incoming, 10);
    EXPECT_TRUE(window.size() == 60, "window keeps maxLen + warm-up, got " << window.size());
    const auto series = f.store.loadRaw(kSymbol, 1);
    EXPECT_TRUE(series.size() == 50, "persisted series must be trimmed to maxLen, got " << series.size());
    EXPECT_TRUE(series.back().timestamp == incoming.back().timestamp, "trim must keep the newest candles");
    EXPECT_TRUE(series.front().timestamp == incoming[30].timestamp, "trim must drop the oldest candles");
    return 0;
}

int testIngestTopsUpShortHistory() {
    Fixture f;
    f.exchange.history = makeSeries(kBase + 59 * 900, 15, 60);
    const domain::CandleSeries recent(f.exchange.history.end() - 10, f.exchange.history.end());

    EXPECT_TRUE(f.store.ingest(kSymbol, 15, recent), "ingest with top-up should compute indicators");
    EXPECT_TRUE(f.exchange.beforeCalls == 1, "short history should trigger exactly one top-up");

    const auto rows = f.store.loadIndicators(kSymbol, 15);
    EXPECT_TRUE(rows.size() >= 30, "indicator series should cover the topped-up window, size=" << rows.size());
    EXPECT_TRUE(rows.back().candle.timestamp == recent.back().timestamp, "newest row should be the newest candle");
    EXPECT_TRUE(rows.back().indicators.rsi14.has_value(), "rsi14 should be computed on the newest row");
    EXPECT_TRUE(!rows.back().humanTime.empty() && !rows.back().humanTimeKr.empty(), "display times stamped");

    EXPECT_TRUE(f.sink.calls.size() == 1, "sink should receive one batch");
    EXPECT_TRUE(f.sink.calls.front().rows.size() == rows.size(),
                "sink should mirror every written row, got " << f.sink.calls.front().rows.size());
    return 0;
}

int testIngestSkipsWhenHistoryUnavailable() {
    Fixture f;
    f.exchange.failNext = true;
    const auto few = makeSeries(kBase + 9 * 300, 5, 10);
    EXPECT_TRUE(!f.store.ingest(kSymbol, 5, few), "indicators should be skipped without enough history");
    EXPECT_TRUE(f.store.loadRaw(kSymbol, 5).size() == 10, "raw candles are stored even when indicators skip");
    EXPECT_TRUE(f.store.loadIndicators(kSymbol, 5).empty(), "no indicator rows without enough history");
    EXPECT_TRUE(f.sink.calls.empty(), "nothing should reach the sink");
    return 0;
}

int testGapFillWithinCap() {
    Fixture f;
    const auto interval = 3600;
    f.exchange.history = makeSeries(kBase + 20 * interval, 60, 21);
    const domain::CandleSeries stored(f.exchange.history.begin(), f.exchange.history.begin() + 11);
    f.store.merge(kSymbol, 60, stored);

    const auto newest = f.exchange.history.back().timestamp;
    const auto fetched = f.store.detectAndFillGap(kSymbol, 60, newest);
    EXPECT_TRUE(fetched == 9, "hole of nine buckets should be fetched, got " << fetched);
    const auto series = f.store.loadRaw(kSymbol, 60);
    EXPECT_TRUE(series.back().timestamp == newest - interval, "series should reach the bucket before newest");
    EXPECT_TRUE(core::CandleSeriesStore::internalGaps(series, 60).empty(), "no internal holes after the fill");

    EXPECT_TRUE(f.store.detectAndFillGap(kSymbol, 60, newest) == 0, "adjacent newest candle is not a gap");
    return 0;
}

// Same order as a bar-end unit: gap detection, then the polled window.
int testGapBeyondCapKeepsLiveEdgeContiguous() {
    core::SeriesOptions options;
    options.gapBackfillCap = 5;
    Fixture f(options);
    const auto interval = 300;
    f.exchange.history = makeSeries(kBase + 99 * interval, 5, 100);
    f.store.ingest(kSymbol, 5, domain::CandleSeries(f.exchange.history.begin(), f.exchange.history.begin() + 60));
    const auto lastStored = kBase + 59 * interval;
    const auto newest = f.exchange.history.back().timestamp;
    const domain::CandleSeries polled(f.exchange.history.end() - 10, f.exchange.history.end());

    EXPECT_TRUE(f.store.detectAndFillGap(kSymbol, 5, newest) == 5, "fill should be clamped to the cap");
    f.store.ingest(kSymbol, 5, polled);

    auto series = f.store.loadRaw(kSymbol, 5);
    const auto holes = core::CandleSeriesStore::internalGaps(series, 5);
    EXPECT_TRUE(holes.size() == 1, "only the older part of the hole remains, holes=" << holes.size());
    EXPECT_TRUE(holes.front().startTs == lastStored + interval, "hole starts after the stored tail");
    EXPECT_TRUE(holes.front().endTs == newest - 10 * interval,
                "capped fill and polled window reach back to " << holes.front().endTs);
    EXPECT_TRUE(series.back().timestamp == newest, "series ends at the newest candle");

    auto gaps = f.store.unresolvedGaps(kSymbol, 5);
    EXPECT_TRUE(gaps.size() == 1, "remainder should be recorded, markers=" << gaps.size());
    EXPECT_TRUE(gaps.front().startTs == lastStored + interval, "marker start " << gaps.front().startTs);
    EXPECT_TRUE(gaps.front().endTs == newest - 6 * interval, "marker end " << gaps.front().endTs);
    EXPECT_TRUE(f.cache.get(core::keys::gaps(kSymbol, 5)).has_value(), "marker should be persisted");

    EXPECT_TRUE(f.store.detectAndFillGap(kSymbol, 5, newest) == 0, "live edge is contiguous on the next bar end");
    EXPECT_TRUE(f.store.unresolvedGaps(kSymbol, 5).size() == 1, "marker stays until it ages out");
    return 0;
}

int testGapBackfillReachesSink() {
    Fixture f;
    const auto interval = 60;
    f.exchange.history = makeSeries(kBase + 99 * interval, 1, 100);
    f.store.ingest(kSymbol, 1, domain::CandleSeries(f.exchange.history.begin(), f.exchange.history.begin() + 60));
    f.sink.calls.clear();

    const auto newest = f.exchange.history.back().timestamp;
    EXPECT_TRUE(f.store.detectAndFillGap(kSymbol, 1, newest) == 39, "whole hole is within the cap");
    f.store.ingest(kSymbol, 1, domain::CandleSeries(f.exchange.history.end() - 10, f.exchange.history.end()));

    std::set<std::int64_t> mirrored;
    for (const auto& call : f.sink.calls) {
        for (const auto& row : call.rows) {
            mirrored.insert(row.candle.timestamp);
        }
    }
    EXPECT_TRUE(f.store.loadIndicators(kSymbol, 1).size() == 100, "indicator series covers the filled range");
    EXPECT_TRUE(mirrored.size() == 40, "backfilled and polled rows reach the sink, got " << mirrored.size());
    EXPECT_TRUE(*mirrored.begin() == kBase + 60 * interval && *mirrored.rbegin() == newest,
                "mirrored range spans the hole and the live edge");
    return 0;
}

int testBarEndKeepsWarmedRows() {
    core::SeriesOptions options;
    options.maxLen = 250;
    Fixture f(options);
    const auto interval = 60;
    const auto history = makeSeries(kBase + 449 * interval, 1, 450);
    const domain::CandleSeries initial(history.begin(), history.end() - 1);

    EXPECT_TRUE(f.store.ingest(kSymbol, 1, initial, 199), "initial load computes indicators");
    auto rows = f.store.loadIndicators(kSymbol, 1);
    EXPECT_TRUE(rows.size() == 250, "indicator series holds maxLen rows, got " << rows.size());
    EXPECT_TRUE(rows.front().indicators.sma200.has_value(), "warm-up gives the oldest row a long average");
    const auto oldestSma = *rows.front().indicators.sma200;

    EXPECT_TRUE(f.store.ingest(kSymbol, 1, domain::CandleSeries(history.end() - 10, history.end())),
                "bar-end ingest computes indicators");
    rows = f.store.loadIndicators(kSymbol, 1);
    EXPECT_TRUE(rows.size() == 250, "series stays at maxLen, got " << rows.size());
    EXPECT_TRUE(rows.back().candle.timestamp == history.back().timestamp, "new candle appended");
    const auto unset = std::count_if(rows.begin(), rows.end(), [](const domain::IndicatorCandle& row) {
        return !row.indicators.sma200.has_value();
    });
    EXPECT_TRUE(unset == 0, "warmed rows must not be overwritten by shorter history, unset=" << unset);
    EXPECT_TRUE(rows.front().candle.timestamp == history[200].timestamp, "oldest row trimmed by one");
    EXPECT_TRUE(rows[0].indicators.sma200.has_value() && *rows[0].indicators.sma200 > oldestSma,
                "surviving rows keep their warmed values");
    return 0;
}

int testWarmUpOnlyWindowSkips() {
    Fixture f;
    const auto window = makeSeries(kBase + 39 * 60, 1, 40);
    EXPECT_TRUE(!f.store.computeIndicators(kSymbol, 1, window, 40), "all rows are warm-up");
    EXPECT_TRUE(f.store.loadIndicators(kSymbol, 1).empty(), "warm-up rows are never persisted");
    EXPECT_TRUE(f.sink.calls.empty(), "nothing mirrored");
    return 0;
}

int testInternalGaps() {
    const domain::CandleSeries series{makeCandle(kBase, 1.0), makeCandle(kBase + 60, 1.0),
                                      makeCandle(kBase + 300, 1.0)};
    const auto gaps = core::CandleSeriesStore::internalGaps(series, 1);
    EXPECT_TRUE(gaps.size() == 1, "one hole expected, got " << gaps.size());
    EXPECT_TRUE(gaps.front().startTs == kBase + 120 && gaps.front().endTs == kBase + 240, "hole bounds wrong");
    return 0;
}

int testCurrentCandleSlots() {
    Fixture f;
    const auto interval = 60;
    f.exchange.history = makeSeries(kBase + 39 * interval, 1, 40);
    f.store.ingest(kSymbol, 1, f.exchange.history);
    f.sink.calls.clear();

    auto current = makeCandle(kBase + 40 * interval, 200.0);
    current.isCurrent = true;
    f.exchange.current = current;
    const auto now = current.timestamp + 20;

    EXPECT_TRUE(f.store.updateCurrentCandle(kSymbol, 1, now), "in-progress candle should be written");
    const auto plain = f.cache.get(core::keys::current(kSymbol, 1));
    const auto latest = f.cache.get(core::keys::latest(kSymbol, 1));
    EXPECT_TRUE(plain && latest, "current_candle and latest slots should be set");
    const auto decoded = core::codec::decodeIndicator(*plain);
    EXPECT_TRUE(decoded && decoded->candle.isCurrent && decoded->candle.timestamp == current.timestamp,
                "current slot should hold the in-progress candle");
    EXPECT_TRUE(!decoded->updateTime.empty(), "current slot carries an update time");

    const auto enriched = f.cache.get(core::keys::currentWithIndicators(kSymbol, 1));
    EXPECT_TRUE(enriched.has_value(), "indicator slot should be written with enough history");
    const auto enrichedRow = core::codec::decodeIndicator(*enriched);
    EXPECT_TRUE(enrichedRow && enrichedRow->indicators.rsi14.has_value(), "indicator slot should carry rsi14");
    EXPECT_TRUE(f.sink.calls.size() == 1 && f.sink.calls.front().rows.size() == 1, "one row mirrored");

    EXPECT_TRUE(f.store.loadRaw(kSymbol, 1).back().timestamp < current.timestamp,
                "in-progress candle must not enter the raw series");
    return 0;
}

}  // namespace

int main() {
    int failures = 0;
    failures += testLastWriteWins();
    failures += testOutOfOrderInput();
    failures += testRejectsCurrentAndUnaligned();
    failures += testTrimToMaxLen();
    failures += testIngestTopsUpShortHistory();
    failures += testIngestSkipsWhenHistoryUnavailable();
    failures += testGapFillWithinCap();
    failures += testGapBeyondCapKeepsLiveEdgeContiguous();
    failures += testGapBackfillReachesSink();
    failures += testBarEndKeepsWarmedRows();
    failures += testWarmUpOnlyWindowSkips();
    failures += testInternalGaps();
    failures += testCurrentCandleSlots();
    if (failures != 0) {
        std::cerr << failures << " series store test(s) failed\n";
        return 1;
    }
    return 0;
}
