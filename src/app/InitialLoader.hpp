#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

#include "app/DistributedLock.hpp"
#include "core/CandleSeriesStore.hpp"
#include "domain/exchange/IExchangeCandles.hpp"

namespace app {

// Startup backfill. Per symbol, timeframes load largest first so every
// coarser series exists before the finer ones that depend on it; a second
// pass then rewrites auto_trend_state everywhere.
class InitialLoader {
public:
    InitialLoader(core::CandleSeriesStore& store,
                  domain::IExchangeCandles& exchange,
                  DistributedLock& lock,
                  std::vector<std::string> symbols,
                  std::vector<int> timeframes,
                  std::size_t warmUp);

    // Returns the number of units that loaded.
    std::size_t run(const std::atomic<bool>& stop);

    bool loadUnit(const std::string& symbol, int minutes);

    const std::vector<int>& order() const noexcept { return timeframes_; }

private:
    core::CandleSeriesStore& store_;
    domain::IExchangeCandles& exchange_;
    DistributedLock& lock_;
    std::vector<std::string> symbols_;
    std::vector<int> timeframes_;
    std::size_t warmUp_;
};

}  // namespace app
