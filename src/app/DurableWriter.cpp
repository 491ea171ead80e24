#include "app/DurableWriter.hpp"

#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"
#include "domain/Timeframe.hpp"

namespace app {

double WriterStats::successRate() const noexcept {
    const auto total = successCount + failureCount;
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(successCount) * 100.0 / static_cast<double>(total);
}

DurableWriter::DurableWriter(domain::ICandleStoreBackend& backend,
                             WriterOptions options,
                             csync::common::Sleeper sleeper,
                             csync::common::EpochClock clock)
    : backend_(backend),
      options_(options),
      sleeper_(std::move(sleeper)),
      clock_(std::move(clock)) {
    if (options_.maxRetries < 0) {
        throw std::invalid_argument("DurableWriter maxRetries must not be negative");
    }
}

DurableWriter::~DurableWriter() {
    shutdown();
}

bool DurableWriter::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    return reconnect_();
}

bool DurableWriter::enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

bool DurableWriter::reconnect_() {
    backend_.close();
    try {
        backend_.open();
        backend_.ping();
        enabled_ = true;
        LOG_INFO("durable writer enabled");
    } catch (const std::exception& ex) {
        backend_.close();
        enabled_ = false;
        LOG_ERR("durable writer unavailable: " << ex.what());
    }
    csync::common::metrics::Registry::instance().setGauge("writer_enabled", enabled_ ? 1.0 : 0.0);
    return enabled_;
}

bool DurableWriter::healthCheck() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    if (lastHealthCheck_ && now - *lastHealthCheck_ < options_.healthCheckInterval.count()) {
        return enabled_;
    }
    lastHealthCheck_ = now;

    if (enabled_) {
        try {
            backend_.ping();
            LOG_DEBUG("durable writer health check ok");
            return true;
        } catch (const std::exception& ex) {
            LOG_WARN("durable writer health check failed: " << ex.what());
            enabled_ = false;
        }
    }

    LOG_INFO("durable writer reconnecting");
    return reconnect_();
}

std::size_t DurableWriter::writeWithRetry_(const std::string& table,
                                           const std::vector<domain::StoredCandleRow>& rows) {
    for (int attempt = 0;; ++attempt) {
        try {
            const auto written = backend_.upsertRows(table, rows);
            if (attempt > 0) {
                LOG_INFO("durable write succeeded table=" << table << " attempt=" << (attempt + 1));
            }
            return written;
        } catch (const domain::StoreConnectionError& ex) {
            ++retryCount_;
            csync::common::metrics::Registry::instance().incrementCounter("writer_retries_total");
            if (attempt >= options_.maxRetries) {
                LOG_ERR("durable write failed table=" << table << " attempts=" << (attempt + 1) << " error="
                                                      << ex.what());
                throw;
            }
            const auto delay = options_.baseDelay * (1LL << attempt);
            LOG_WARN("durable write failed table=" << table << " attempt=" << (attempt + 1) << "/"
                                                   << (options_.maxRetries + 1) << " retry_in_ms=" << delay.count()
                                                   << " error=" << ex.what());
            sleeper_(delay);
        }
    }
}

bool DurableWriter::upsert(const std::string& symbol, int minutes, const domain::IndicatorSeries& candles) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (candles.empty()) {
        return false;
    }
    auto& metrics = csync::common::metrics::Registry::instance();
    if (!enabled_) {
        failureCount_ += candles.size();
        lastFailureTime_ = clock_();
        metrics.incrementCounter("writer_failed_candles", candles.size());
        LOG_DEBUG("durable writer disabled, dropped rows=" << candles.size());
        return false;
    }

    const std::string table = domain::timeframe::normalize_symbol(symbol);
    const auto rows = toRows(minutes, candles);
    if (rows.empty()) {
        LOG_WARN("durable write has no valid rows table=" << table);
        return false;
    }

    try {
        const auto written = writeWithRetry_(table, rows);
        successCount_ += written;
        metrics.incrementCounter("writer_success_rows", written);
        LOG_DEBUG("durable upsert table=" << table << " tf=" << rows.front().timeframe << " rows=" << written
                                          << " success=" << successCount_ << " failures=" << failureCount_);
        return true;
    } catch (const domain::StoreConnectionError& ex) {
        enabled_ = false;
        metrics.setGauge("writer_enabled", 0.0);
        LOG_ERR("durable writer disabled after connection failure: " << ex.what());
    } catch (const domain::StoreDataError& ex) {
        LOG_ERR("durable write rejected table=" << table << " error=" << ex.what());
    }

    failureCount_ += candles.size();
    lastFailureTime_ = clock_();
    metrics.incrementCounter("writer_failed_candles", candles.size());
    return false;
}

WriterStats DurableWriter::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    WriterStats out;
    out.enabled = enabled_;
    out.successCount = successCount_;
    out.failureCount = failureCount_;
    out.retryCount = retryCount_;
    out.lastFailureTime = lastFailureTime_;
    out.lastHealthCheck = lastHealthCheck_;
    return out;
}

void DurableWriter::logStats() const {
    const auto snapshot = stats();
    char rate[16];
    std::snprintf(rate, sizeof(rate), "%.2f", snapshot.successRate());
    LOG_INFO("durable writer stats enabled=" << (snapshot.enabled ? "true" : "false")
                                             << " success=" << snapshot.successCount
                                             << " failure=" << snapshot.failureCount
                                             << " retries=" << snapshot.retryCount << " success_rate=" << rate
                                             << "% last_failure="
                                             << (snapshot.lastFailureTime
                                                     ? csync::common::formatUtc(*snapshot.lastFailureTime)
                                                     : std::string{"never"}));
}

void DurableWriter::shutdown() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (enabled_) {
        LOG_INFO("durable writer shutting down success=" << successCount_ << " failure=" << failureCount_);
    }
    enabled_ = false;
    backend_.close();
}

std::string DurableWriter::toDecimal(double value) {
    char buffer[64];
    const int written = std::snprintf(buffer, sizeof(buffer), "%.8f", value);
    if (written < 0 || static_cast<std::size_t>(written) >= sizeof(buffer)) {
        throw std::invalid_argument("value does not fit a DECIMAL column");
    }
    return std::string(buffer, static_cast<std::size_t>(written));
}

std::vector<domain::StoredCandleRow> DurableWriter::toRows(int minutes, const domain::IndicatorSeries& candles) {
    const std::string timeframe = domain::timeframe::convert_timeframe(minutes);
    std::vector<domain::StoredCandleRow> rows;
    rows.reserve(candles.size());
    for (const auto& item : candles) {
        const auto& c = item.candle;
        if (!std::isfinite(c.open) || !std::isfinite(c.high) || !std::isfinite(c.low) || !std::isfinite(c.close) ||
            !std::isfinite(c.volume)) {
            LOG_WARN("durable row skipped ts=" << c.timestamp << ": non-finite OHLCV");
            continue;
        }
        domain::StoredCandleRow row;
        row.time = c.timestamp;
        row.timeframe = timeframe;
        try {
            row.open = toDecimal(c.open);
            row.high = toDecimal(c.high);
            row.low = toDecimal(c.low);
            row.close = toDecimal(c.close);
            row.volume = toDecimal(c.volume);
        } catch (const std::invalid_argument& ex) {
            LOG_WARN("durable row skipped ts=" << c.timestamp << ": " << ex.what());
            continue;
        }
        row.rsi14 = item.indicators.rsi14;
        row.atr = item.indicators.atr14;
        row.ema7 = item.indicators.ema7;
        row.ma20 = item.indicators.sma20;
        row.trendState = item.indicators.trendState;
        row.autoTrendState = item.indicators.autoTrendState;
        rows.push_back(std::move(row));
    }
    return rows;
}

}  // namespace app
