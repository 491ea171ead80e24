#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "indicators/EMACalculator.h"
#include "indicators/IndicatorEngine.h"
#include "TestSupport.hpp"

namespace {

using testsupport::makeCandle;
using testsupport::makeSeries;

constexpr std::int64_t kBase = 1704067200;

domain::CandleSeries fallingSeries(std::int64_t lastTs, int minutes, std::size_t count) {
    auto series = makeSeries(lastTs, minutes, count);
    for (std::size_t i = 0; i < series.size(); ++i) {
        const double close = 500.0 - static_cast<double>(i);
        series[i] = makeCandle(series[i].timestamp, close);
    }
    return series;
}

int testMinimumCandleBoundary() {
    indicators::IndicatorEngine engine;  // default minimum 199
    const auto exact = makeSeries(kBase + 198 * 60, 1, 199);
    const auto rows = engine.compute(exact, {});
    EXPECT_TRUE(rows.size() == exact.size(), "one output row per input candle");

    bool threw = false;
    try {
        engine.compute(domain::CandleSeries(exact.begin() + 1, exact.end()), {});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    EXPECT_TRUE(threw, "198 candles should be rejected");
    return 0;
}

int testIndicatorValues() {
    indicators::IndicatorParams params;
    params.minimumCandles = 30;
    indicators::IndicatorEngine engine(params);
    const auto candles = makeSeries(kBase + 39 * 60, 1, 40);
    const auto rows = engine.compute(candles, {});

    EXPECT_TRUE(!rows[12].indicators.rsi14.has_value(), "rsi14 needs 15 closes");
    EXPECT_TRUE(rows[14].indicators.rsi14.has_value(), "rsi14 seeded at index 14");
    EXPECT_TRUE(std::fabs(*rows.back().indicators.rsi14 - 100.0) < 1e-9, "monotonic gains give rsi 100");

    EXPECT_TRUE(rows[18].indicators.sma20 == std::nullopt, "sma20 needs twenty closes");
    const double expectedSma = (120.0 + 139.0) / 2.0;  // closes 120..139
    EXPECT_TRUE(std::fabs(*rows.back().indicators.sma20 - expectedSma) < 1e-9, "sma20 of the last twenty closes");
    EXPECT_TRUE(!rows.back().indicators.sma200.has_value(), "sma200 stays null on short series");

    // true range is high - low = 2 on a one-point step with +/-1 wicks
    EXPECT_TRUE(std::fabs(*rows.back().indicators.atr14 - 2.0) < 1e-9, "constant true range gives atr 2");

    const auto ema = indicators::EMACalculator::emaSeries({1.0, 2.0, 3.0, 4.0}, 3);
    EXPECT_TRUE(!ema[1].has_value() && ema[2] && *ema[2] == 2.0, "ema seeds with the sma");
    EXPECT_TRUE(std::fabs(*ema[3] - 3.0) < 1e-9, "ema step with multiplier 0.5");
    return 0;
}

int testTrendStates() {
    const auto rising = indicators::IndicatorEngine::trendStates(makeSeries(kBase + 59 * 60, 1, 60));
    const auto falling = indicators::IndicatorEngine::trendStates(fallingSeries(kBase + 59 * 60, 1, 60));
    EXPECT_TRUE(rising.front() == 0, "trend is neutral before the averages exist");
    EXPECT_TRUE(rising.back() == 2, "steady rise should score +2, got " << rising.back());
    EXPECT_TRUE(falling.back() == -2, "steady fall should score -2, got " << falling.back());
    for (int state : rising) {
        EXPECT_TRUE(state >= -2 && state <= 2, "trend state out of range: " << state);
    }
    return 0;
}

int testAutoTrendFromCoarser() {
    indicators::IndicatorParams params;
    params.minimumCandles = 30;
    indicators::IndicatorEngine engine(params);

    const auto coarser = fallingSeries(kBase + 39 * 300, 5, 40);
    const auto fine = makeSeries(coarser.back().timestamp + 4 * 60, 1, 30);
    const auto rows = engine.compute(fine, coarser);
    EXPECT_TRUE(rows.back().indicators.autoTrendState == -2,
                "auto trend should follow the enclosing coarser bucket, got "
                    << rows.back().indicators.autoTrendState.value_or(99));

    const domain::CandleSeries shortCoarser(coarser.end() - 29, coarser.end());
    const auto neutral = engine.compute(fine, shortCoarser);
    for (const auto& row : neutral) {
        EXPECT_TRUE(row.indicators.autoTrendState == 0, "fewer than 30 coarser candles gives a neutral auto trend");
    }

    const auto beforeCoarser = makeSeries(coarser.front().timestamp - 60, 1, 30);
    const auto early = engine.compute(beforeCoarser, coarser);
    EXPECT_TRUE(early.back().indicators.autoTrendState == 0, "candles older than the coarser series stay neutral");
    return 0;
}

}  // namespace

int main() {
    int failures = 0;
    failures += testMinimumCandleBoundary();
    failures += testIndicatorValues();
    failures += testTrendStates();
    failures += testAutoTrendFromCoarser();
    if (failures != 0) {
        std::cerr << failures << " indicator test(s) failed\n";
        return 1;
    }
    return 0;
}
