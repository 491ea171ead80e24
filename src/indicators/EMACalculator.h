#pragma once

#include <optional>
#include <vector>

namespace indicators {

class EMACalculator {
public:
    static double calculateEmaFromScratch(const std::vector<double>& prices, int periods);
    static double calculateEmaWithPrevious(double previousEma, double newPrice, int periods);

    // One value per price; empty until the SMA seed at index periods - 1.
    static std::vector<std::optional<double>> emaSeries(const std::vector<double>& prices, int periods);
};

}  // namespace indicators
