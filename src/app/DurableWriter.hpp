#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/TimeUtils.hpp"
#include "domain/Candle.hpp"
#include "domain/Ports.hpp"

namespace app {

struct WriterOptions {
    int maxRetries = 3;
    std::chrono::milliseconds baseDelay{1000};
    std::chrono::seconds healthCheckInterval{60};
};

struct WriterStats {
    bool enabled{false};
    std::uint64_t successCount{0};
    std::uint64_t failureCount{0};
    std::uint64_t retryCount{0};
    std::optional<std::int64_t> lastFailureTime{};
    std::optional<std::int64_t> lastHealthCheck{};

    // Percentage of rows written over rows attempted; 0 before any attempt.
    double successRate() const noexcept;
};

// Mirrors computed candles into the durable store. Disabled until the
// backend opens; a connection failure that outlives the retries disables
// it again and the throttled health check brings it back.
class DurableWriter : public domain::ICandleSink {
public:
    DurableWriter(domain::ICandleStoreBackend& backend,
                  WriterOptions options = {},
                  csync::common::Sleeper sleeper = csync::common::threadSleeper(),
                  csync::common::EpochClock clock = csync::common::systemEpochClock());
    ~DurableWriter() override;

    DurableWriter(const DurableWriter&) = delete;
    DurableWriter& operator=(const DurableWriter&) = delete;

    bool initialize();
    bool enabled() const;

    bool upsert(const std::string& symbol, int minutes, const domain::IndicatorSeries& candles) override;

    // At most once per healthCheckInterval; returns the resulting state.
    bool healthCheck();

    WriterStats stats() const;
    void logStats() const;

    void shutdown() noexcept;

    static std::vector<domain::StoredCandleRow> toRows(int minutes, const domain::IndicatorSeries& candles);
    // Fixed 8-decimal rendering for DECIMAL columns.
    static std::string toDecimal(double value);

private:
    bool reconnect_();
    std::size_t writeWithRetry_(const std::string& table, const std::vector<domain::StoredCandleRow>& rows);

    domain::ICandleStoreBackend& backend_;
    WriterOptions options_;
    csync::common::Sleeper sleeper_;
    csync::common::EpochClock clock_;

    mutable std::mutex mutex_;
    bool enabled_{false};
    std::uint64_t successCount_{0};
    std::uint64_t failureCount_{0};
    std::uint64_t retryCount_{0};
    std::optional<std::int64_t> lastFailureTime_{};
    std::optional<std::int64_t> lastHealthCheck_{};
};

}  // namespace app
