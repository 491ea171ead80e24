#pragma once

#include <cstddef>

#include "domain/Candle.hpp"

namespace core::ports {

// Pure candles -> candles-with-indicators transform. compute() throws
// std::invalid_argument when given fewer than minimumCandles() candles.
class IIndicatorEngine {
public:
    virtual ~IIndicatorEngine() = default;

    virtual std::size_t minimumCandles() const = 0;

    // coarser is the next-larger timeframe of the same symbol and feeds
    // auto_trend_state; when it is too short that field is 0.
    virtual domain::IndicatorSeries compute(const domain::CandleSeries& candles,
                                            const domain::CandleSeries& coarser) const = 0;

    virtual void applyAutoTrend(domain::IndicatorSeries& candles,
                                const domain::CandleSeries& coarser) const = 0;
};

}  // namespace core::ports
