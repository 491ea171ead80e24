#include "app/InitialLoader.hpp"

#include <algorithm>
#include <functional>
#include <utility>

#include "common/Log.hpp"
#include "domain/Timeframe.hpp"

namespace app {

InitialLoader::InitialLoader(core::CandleSeriesStore& store,
                             domain::IExchangeCandles& exchange,
                             DistributedLock& lock,
                             std::vector<std::string> symbols,
                             std::vector<int> timeframes,
                             std::size_t warmUp)
    : store_(store),
      exchange_(exchange),
      lock_(lock),
      symbols_(std::move(symbols)),
      timeframes_(std::move(timeframes)),
      warmUp_(warmUp) {
    std::sort(timeframes_.begin(), timeframes_.end(), std::greater<int>());
}

bool InitialLoader::loadUnit(const std::string& symbol, int minutes) {
    const std::string code = domain::timeframe::toCode(minutes);
    const csync::log::UnitTag unit{symbol, code};

    ScopedLock guard(lock_, DistributedLock::lockKey(symbol, minutes, "initial"));
    if (!guard) {
        LOG_INFO("initial load skipped, lock held elsewhere " << unit);
        return false;
    }

    try {
        const auto target = store_.options().maxLen + warmUp_;
        const auto candles = exchange_.fetch_candles(symbol, minutes, target);
        LOG_INFO("initial load " << unit << " fetched=" << candles.size() << " target=" << target);
        if (candles.empty()) {
            return false;
        }
        store_.ingest(symbol, minutes, candles, warmUp_);
        return true;
    } catch (const std::exception& ex) {
        LOG_ERR("initial load failed " << unit << " error=" << ex.what());
        return false;
    }
}

std::size_t InitialLoader::run(const std::atomic<bool>& stop) {
    std::size_t loaded = 0;
    for (const auto& symbol : symbols_) {
        for (int minutes : timeframes_) {
            if (stop.load(std::memory_order_acquire)) {
                return loaded;
            }
            if (loadUnit(symbol, minutes)) {
                ++loaded;
            }
        }
    }

    for (const auto& symbol : symbols_) {
        for (int minutes : timeframes_) {
            if (stop.load(std::memory_order_acquire)) {
                return loaded;
            }
            try {
                store_.recomputeAutoTrend(symbol, minutes);
            } catch (const std::exception& ex) {
                const std::string code = domain::timeframe::toCode(minutes);
                LOG_ERR("auto trend pass failed " << (csync::log::UnitTag{symbol, code}) << " error=" << ex.what());
            }
        }
    }
    LOG_INFO("initial load finished units=" << loaded);
    return loaded;
}

}  // namespace app
