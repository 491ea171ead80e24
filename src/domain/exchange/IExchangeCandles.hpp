#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "domain/Candle.hpp"

namespace domain {

// Opaque market-data source. Returned candles are aligned, ascending and
// unique by timestamp. Failures throw ExchangeError.
class IExchangeCandles {
public:
    virtual ~IExchangeCandles() = default;

    // Newest `limit` candles, or the `limit` candles starting at since_ms
    // when it is set. Requests above the per-call maximum are paginated.
    virtual std::vector<Candle> fetch_candles(const std::string& symbol,
                                              int minutes,
                                              std::size_t limit,
                                              std::optional<std::int64_t> since_ms = std::nullopt) = 0;

    // `limit` candles strictly older than before_sec, walking backward.
    virtual std::vector<Candle> fetch_candles_before(const std::string& symbol,
                                                     int minutes,
                                                     std::size_t limit,
                                                     std::int64_t before_sec) = 0;
};

}  // namespace domain
