#pragma once

#include <cstddef>
#include <vector>

#include "core/ports/IIndicatorEngine.hpp"
#include "domain/Candle.hpp"

namespace indicators {

struct IndicatorParams {
    int rsiPeriod = 14;
    int atrPeriod = 14;
    int emaPeriod = 7;
    int smaPeriod = 20;
    int longSmaPeriod = 200;
    std::size_t minimumCandles = 199;
    std::size_t minimumTrendCandles = 30;
};

// RSI and ATR use Wilder smoothing; trend_state sums the alignment of
// SMA 5/10/20 and EMA 3/9/21 into [-2, 2].
class IndicatorEngine : public core::ports::IIndicatorEngine {
public:
    explicit IndicatorEngine(IndicatorParams params = {});

    std::size_t minimumCandles() const override { return params_.minimumCandles; }

    domain::IndicatorSeries compute(const domain::CandleSeries& candles,
                                    const domain::CandleSeries& coarser) const override;

    void applyAutoTrend(domain::IndicatorSeries& candles,
                        const domain::CandleSeries& coarser) const override;

    static std::vector<int> trendStates(const domain::CandleSeries& candles);

private:
    IndicatorParams params_;
};

}  // namespace indicators
