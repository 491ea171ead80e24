#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace domain {

using Symbol = std::string;

// One OHLCV bucket. timestamp is in epoch seconds and aligned to the
// bucket width of the series that holds it.
struct Candle {
    std::int64_t timestamp{0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};
    bool isCurrent{false};
};

struct IndicatorFields {
    std::optional<double> rsi14{};
    std::optional<double> atr14{};
    std::optional<double> ema7{};
    std::optional<double> sma20{};
    std::optional<double> sma200{};
    std::optional<int> trendState{};
    std::optional<int> autoTrendState{};
};

struct IndicatorCandle {
    Candle candle{};
    IndicatorFields indicators{};
    // Display only; never used for ordering.
    std::string humanTime;
    std::string humanTimeKr;
    std::string updateTime;
    std::string updateTimeKr;
};

using CandleSeries = std::vector<Candle>;
using IndicatorSeries = std::vector<IndicatorCandle>;

// [start_ts, end_ts] of missing buckets, both aligned and inclusive.
struct Gap {
    std::int64_t startTs{0};
    std::int64_t endTs{0};

    bool operator==(const Gap& other) const noexcept {
        return startTs == other.startTs && endTs == other.endTs;
    }
};

}  // namespace domain
