#include "indicators/EMACalculator.h"

#include <stdexcept>

namespace indicators {

double EMACalculator::calculateEmaFromScratch(const std::vector<double>& prices, int periods) {
    if (periods <= 0) {
        throw std::invalid_argument("EMA period must be positive");
    }

    if (prices.size() < static_cast<std::size_t>(periods)) {
        throw std::invalid_argument("Not enough prices to compute EMA");
    }

    double ema = 0.0;
    for (int i = 0; i < periods; ++i) {
        ema += prices[static_cast<std::size_t>(i)];
    }
    ema /= static_cast<double>(periods);

    for (std::size_t i = static_cast<std::size_t>(periods); i < prices.size(); ++i) {
        ema = calculateEmaWithPrevious(ema, prices[i], periods);
    }

    return ema;
}

double EMACalculator::calculateEmaWithPrevious(double previousEma, double newPrice, int periods) {
    if (periods <= 0) {
        throw std::invalid_argument("EMA period must be positive");
    }

    const double multiplier = 2.0 / (static_cast<double>(periods) + 1.0);
    return ((newPrice - previousEma) * multiplier) + previousEma;
}

std::vector<std::optional<double>> EMACalculator::emaSeries(const std::vector<double>& prices, int periods) {
    if (periods <= 0) {
        throw std::invalid_argument("EMA period must be positive");
    }

    std::vector<std::optional<double>> out(prices.size());
    const auto seedIndex = static_cast<std::size_t>(periods - 1);
    if (prices.size() <= seedIndex) {
        return out;
    }

    double ema = 0.0;
    for (std::size_t i = 0; i <= seedIndex; ++i) {
        ema += prices[i];
    }
    ema /= static_cast<double>(periods);
    out[seedIndex] = ema;

    for (std::size_t i = seedIndex + 1; i < prices.size(); ++i) {
        ema = calculateEmaWithPrevious(ema, prices[i], periods);
        out[i] = ema;
    }
    return out;
}

}  // namespace indicators
