#include "app/PollingScheduler.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"
#include "domain/Timeframe.hpp"

namespace app {

PollingScheduler::PollingScheduler(core::CandleSeriesStore& store,
                                   domain::IExchangeCandles& exchange,
                                   DistributedLock& lock,
                                   DurableWriter& writer,
                                   domain::ICacheStore& cache,
                                   SchedulerOptions options,
                                   csync::common::EpochClock clock,
                                   csync::common::Sleeper sleeper)
    : store_(store),
      exchange_(exchange),
      lock_(lock),
      writer_(writer),
      cache_(cache),
      options_(std::move(options)),
      clock_(std::move(clock)),
      sleeper_(std::move(sleeper)) {
    if (options_.symbols.empty() || options_.timeframes.empty()) {
        throw std::invalid_argument("PollingScheduler requires symbols and timeframes");
    }
}

const char* PollingScheduler::to_string(UnitKind kind) noexcept {
    switch (kind) {
    case UnitKind::BarEnd:
        return "bar_end";
    case UnitKind::Current:
        return "current";
    }
    return "unknown";
}

void PollingScheduler::run(const std::atomic<bool>& stop) {
    csync::log::setThreadName("poller");
    LOG_INFO("polling scheduler started symbols=" << options_.symbols.size()
                                                  << " timeframes=" << options_.timeframes.size()
                                                  << " interval_ms=" << options_.pollInterval.count());
    while (!stop.load(std::memory_order_acquire)) {
        tick();
        sleeper_(options_.pollInterval);
    }
    LOG_INFO("polling scheduler stopped");
}

void PollingScheduler::maintenance_(std::int64_t now) {
    if (!lastHealthCheck_) {
        lastHealthCheck_ = now;
    } else if (now - *lastHealthCheck_ >= options_.healthCheckEvery.count()) {
        lastHealthCheck_ = now;
        const bool writerUp = writer_.healthCheck();
        bool cacheUp = false;
        try {
            cacheUp = cache_.ping();
        } catch (const std::exception& ex) {
            LOG_WARN("cache ping failed: " << ex.what());
        }
        LOG_INFO("health check writer=" << (writerUp ? "up" : "down") << " cache=" << (cacheUp ? "up" : "down"));
    }

    if (!lastStats_) {
        lastStats_ = now;
    } else if (now - *lastStats_ >= options_.statsEvery.count()) {
        lastStats_ = now;
        writer_.logStats();
        try {
            const auto diagnostics = cacheDiagnostics();
            LOG_INFO("cache diagnostics held_locks=" << diagnostics.heldLocks
                                                     << " gap_markers=" << diagnostics.gapMarkers);
        } catch (const std::exception& ex) {
            LOG_WARN("cache diagnostics failed: " << ex.what());
        }
    }
}

CacheDiagnostics PollingScheduler::cacheDiagnostics() {
    CacheDiagnostics out;
    out.heldLocks = cache_.scan("lock:*").size();
    out.gapMarkers = cache_.scan("gaps:*").size();
    auto& metrics = csync::common::metrics::Registry::instance();
    metrics.setGauge("locks_held", static_cast<double>(out.heldLocks));
    metrics.setGauge("gap_marker_keys", static_cast<double>(out.gapMarkers));
    return out;
}

void PollingScheduler::tick() {
    const auto now = clock_();
    maintenance_(now);

    for (const auto& symbol : options_.symbols) {
        for (int minutes : options_.timeframes) {
            const UnitKey key{symbol, minutes};

            if (domain::timeframe::isBarEndWindow(now, minutes)) {
                const auto it = lastBarEnd_.find(key);
                if (it == lastBarEnd_.end() || now - it->second >= options_.barEndCooldown.count()) {
                    lastBarEnd_[key] = now;
                    runUnit(symbol, minutes, UnitKind::BarEnd, now);
                    continue;
                }
            }

            const auto refresh = domain::timeframe::refreshInterval(minutes).count();
            const auto it = lastCurrent_.find(key);
            if (it == lastCurrent_.end() || now - it->second >= refresh) {
                lastCurrent_[key] = now;
                runUnit(symbol, minutes, UnitKind::Current, now);
            }
        }
    }
}

bool PollingScheduler::runUnit(const std::string& symbol, int minutes, UnitKind kind, std::int64_t now) {
    const std::string code = domain::timeframe::toCode(minutes);
    const csync::log::UnitTag unit{symbol, code};

    ScopedLock guard(lock_, DistributedLock::lockKey(symbol, minutes, to_string(kind)));
    if (!guard) {
        LOG_DEBUG("unit skipped, lock held elsewhere " << unit << " kind=" << to_string(kind));
        return false;
    }

    auto& metrics = csync::common::metrics::Registry::instance();
    metrics.incrementCounter("poll_units_total");
    try {
        csync::common::metrics::Registry::ScopedTimer timer(std::string{"poll_unit_"} + to_string(kind));
        if (kind == UnitKind::BarEnd) {
            barEnd_(symbol, minutes);
        } else {
            store_.updateCurrentCandle(symbol, minutes, now);
        }
        return true;
    } catch (const domain::ExchangeError& ex) {
        metrics.incrementCounter("poll_unit_failures_total");
        LOG_WARN("unit failed " << unit << " kind=" << to_string(kind) << " exchange_error="
                                << domain::to_string(ex.kind()) << " error=" << ex.what());
        return false;
    } catch (const std::exception& ex) {
        metrics.incrementCounter("poll_unit_failures_total");
        LOG_ERR("unit failed " << unit << " kind=" << to_string(kind) << " error=" << ex.what());
        return false;
    }
}

void PollingScheduler::barEnd_(const std::string& symbol, int minutes) {
    const auto fetched = exchange_.fetch_candles(symbol, minutes, options_.pollingCandles);

    std::optional<std::int64_t> newestCompleted;
    for (const auto& candle : fetched) {
        if (!candle.isCurrent) {
            newestCompleted = std::max(newestCompleted.value_or(candle.timestamp), candle.timestamp);
        }
    }
    if (!newestCompleted) {
        LOG_DEBUG("bar end without completed candles symbol=" << symbol << " minutes=" << minutes);
        return;
    }

    store_.detectAndFillGap(symbol, minutes, *newestCompleted);
    store_.ingest(symbol, minutes, fetched);
}

}  // namespace app
