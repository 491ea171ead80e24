#include "indicators/IndicatorEngine.h"

#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>

#include "indicators/EMACalculator.h"

namespace indicators {
namespace {

using Series = std::vector<std::optional<double>>;

std::vector<double> closes_of(const domain::CandleSeries& candles) {
    std::vector<double> closes;
    closes.reserve(candles.size());
    for (const auto& candle : candles) {
        closes.push_back(candle.close);
    }
    return closes;
}

Series sma_series(const std::vector<double>& values, int period) {
    Series out(values.size());
    if (period <= 0 || values.size() < static_cast<std::size_t>(period)) {
        return out;
    }
    double sum = 0.0;
    for (std::size_t i = 0; i < values.size(); ++i) {
        sum += values[i];
        if (i >= static_cast<std::size_t>(period)) {
            sum -= values[i - static_cast<std::size_t>(period)];
        }
        if (i + 1 >= static_cast<std::size_t>(period)) {
            out[i] = sum / static_cast<double>(period);
        }
    }
    return out;
}

Series rsi_series(const std::vector<double>& closes, int period) {
    Series out(closes.size());
    const auto p = static_cast<std::size_t>(period);
    if (closes.size() <= p) {
        return out;
    }

    double avgGain = 0.0;
    double avgLoss = 0.0;
    for (std::size_t i = 1; i <= p; ++i) {
        const double delta = closes[i] - closes[i - 1];
        avgGain += std::max(delta, 0.0);
        avgLoss += std::max(-delta, 0.0);
    }
    avgGain /= static_cast<double>(period);
    avgLoss /= static_cast<double>(period);

    const auto rsi = [](double gain, double loss) {
        if (loss == 0.0) {
            return gain == 0.0 ? 50.0 : 100.0;
        }
        return 100.0 - 100.0 / (1.0 + gain / loss);
    };

    out[p] = rsi(avgGain, avgLoss);
    for (std::size_t i = p + 1; i < closes.size(); ++i) {
        const double delta = closes[i] - closes[i - 1];
        avgGain = (avgGain * (period - 1) + std::max(delta, 0.0)) / period;
        avgLoss = (avgLoss * (period - 1) + std::max(-delta, 0.0)) / period;
        out[i] = rsi(avgGain, avgLoss);
    }
    return out;
}

Series atr_series(const domain::CandleSeries& candles, int period) {
    Series out(candles.size());
    const auto p = static_cast<std::size_t>(period);
    if (candles.size() < p) {
        return out;
    }

    std::vector<double> trueRange(candles.size());
    for (std::size_t i = 0; i < candles.size(); ++i) {
        const auto& c = candles[i];
        double tr = c.high - c.low;
        if (i > 0) {
            const double prevClose = candles[i - 1].close;
            tr = std::max({tr, std::fabs(c.high - prevClose), std::fabs(c.low - prevClose)});
        }
        trueRange[i] = tr;
    }

    double atr = 0.0;
    for (std::size_t i = 0; i < p; ++i) {
        atr += trueRange[i];
    }
    atr /= static_cast<double>(period);
    out[p - 1] = atr;
    for (std::size_t i = p; i < candles.size(); ++i) {
        atr = (atr * (period - 1) + trueRange[i]) / period;
        out[i] = atr;
    }
    return out;
}

int cycle_score(const std::optional<double>& fast,
                const std::optional<double>& mid,
                const std::optional<double>& slow) {
    if (!fast || !mid || !slow) {
        return 0;
    }
    const double f = *fast;
    const double m = *mid;
    const double s = *slow;
    if ((f > m && m > s) || (m > f && f > s)) {
        return 1;
    }
    if (s > m && m > f) {
        return -1;
    }
    return 0;
}

}  // namespace

IndicatorEngine::IndicatorEngine(IndicatorParams params) : params_(params) {
    if (params_.minimumCandles == 0) {
        throw std::invalid_argument("IndicatorEngine minimum candle count must be positive");
    }
}

std::vector<int> IndicatorEngine::trendStates(const domain::CandleSeries& candles) {
    const auto closes = closes_of(candles);
    const auto fast = sma_series(closes, 5);
    const auto mid = sma_series(closes, 10);
    const auto slow = sma_series(closes, 20);
    const auto fast2 = EMACalculator::emaSeries(closes, 3);
    const auto mid2 = EMACalculator::emaSeries(closes, 9);
    const auto slow2 = EMACalculator::emaSeries(closes, 21);

    std::vector<int> states(candles.size(), 0);
    for (std::size_t i = 0; i < candles.size(); ++i) {
        states[i] = cycle_score(fast[i], mid[i], slow[i]) + cycle_score(fast2[i], mid2[i], slow2[i]);
    }
    return states;
}

domain::IndicatorSeries IndicatorEngine::compute(const domain::CandleSeries& candles,
                                                 const domain::CandleSeries& coarser) const {
    if (candles.size() < params_.minimumCandles) {
        throw std::invalid_argument("IndicatorEngine needs at least " + std::to_string(params_.minimumCandles) +
                                    " candles, got " + std::to_string(candles.size()));
    }

    const auto closes = closes_of(candles);
    const auto rsi = rsi_series(closes, params_.rsiPeriod);
    const auto atr = atr_series(candles, params_.atrPeriod);
    const auto ema = EMACalculator::emaSeries(closes, params_.emaPeriod);
    const auto sma = sma_series(closes, params_.smaPeriod);
    const auto longSma = sma_series(closes, params_.longSmaPeriod);
    const auto trend = trendStates(candles);

    domain::IndicatorSeries out;
    out.reserve(candles.size());
    for (std::size_t i = 0; i < candles.size(); ++i) {
        domain::IndicatorCandle row{};
        row.candle = candles[i];
        row.indicators.rsi14 = rsi[i];
        row.indicators.atr14 = atr[i];
        row.indicators.ema7 = ema[i];
        row.indicators.sma20 = sma[i];
        row.indicators.sma200 = longSma[i];
        row.indicators.trendState = trend[i];
        out.push_back(std::move(row));
    }

    applyAutoTrend(out, coarser);
    return out;
}

void IndicatorEngine::applyAutoTrend(domain::IndicatorSeries& candles,
                                     const domain::CandleSeries& coarser) const {
    if (coarser.size() < params_.minimumTrendCandles) {
        for (auto& row : candles) {
            row.indicators.autoTrendState = 0;
        }
        return;
    }

    const auto states = trendStates(coarser);
    std::size_t index = 0;
    for (auto& row : candles) {
        const auto ts = row.candle.timestamp;
        while (index + 1 < coarser.size() && coarser[index + 1].timestamp <= ts) {
            ++index;
        }
        row.indicators.autoTrendState = coarser[index].timestamp <= ts ? states[index] : 0;
    }
}

}  // namespace indicators
