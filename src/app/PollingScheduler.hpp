#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "app/DistributedLock.hpp"
#include "app/DurableWriter.hpp"
#include "common/TimeUtils.hpp"
#include "core/CandleSeriesStore.hpp"
#include "domain/Ports.hpp"
#include "domain/exchange/IExchangeCandles.hpp"

namespace app {

struct SchedulerOptions {
    std::vector<std::string> symbols;
    std::vector<int> timeframes;
    std::size_t pollingCandles = 10;
    std::chrono::milliseconds pollInterval{1000};
    std::chrono::seconds healthCheckEvery{300};
    std::chrono::seconds statsEvery{600};
    std::chrono::seconds barEndCooldown{5};
};

struct CacheDiagnostics {
    std::size_t heldLocks = 0;
    std::size_t gapMarkers = 0;
};

// Polling context. Each tick walks the symbol x timeframe matrix and runs
// at most one locked unit per pair: the completed-candle fetch inside the
// bar-end window, else the in-progress refresh when it is due.
class PollingScheduler {
public:
    enum class UnitKind {
        BarEnd,
        Current,
    };

    PollingScheduler(core::CandleSeriesStore& store,
                     domain::IExchangeCandles& exchange,
                     DistributedLock& lock,
                     DurableWriter& writer,
                     domain::ICacheStore& cache,
                     SchedulerOptions options,
                     csync::common::EpochClock clock = csync::common::systemEpochClock(),
                     csync::common::Sleeper sleeper = csync::common::threadSleeper());

    void tick();
    // Ticks until stop is set; the flag is checked once per iteration.
    void run(const std::atomic<bool>& stop);

    // Returns false when the lock was refused or the unit failed.
    bool runUnit(const std::string& symbol, int minutes, UnitKind kind, std::int64_t now);

    // Counts live lock:* and gaps:* keys. Throws CacheError.
    CacheDiagnostics cacheDiagnostics();

    static const char* to_string(UnitKind kind) noexcept;

private:
    using UnitKey = std::pair<std::string, int>;

    void maintenance_(std::int64_t now);
    void barEnd_(const std::string& symbol, int minutes);

    core::CandleSeriesStore& store_;
    domain::IExchangeCandles& exchange_;
    DistributedLock& lock_;
    DurableWriter& writer_;
    domain::ICacheStore& cache_;
    SchedulerOptions options_;
    csync::common::EpochClock clock_;
    csync::common::Sleeper sleeper_;

    std::map<UnitKey, std::int64_t> lastBarEnd_;
    std::map<UnitKey, std::int64_t> lastCurrent_;
    std::optional<std::int64_t> lastHealthCheck_;
    std::optional<std::int64_t> lastStats_;
};

}  // namespace app
