#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "domain/Candle.hpp"

namespace domain {

// Key-value cache shared by every ingestion context and downstream reader.
// Implementations throw CacheError when the backend cannot be reached.
class ICacheStore {
public:
    virtual ~ICacheStore() = default;

    virtual bool ping() = 0;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key,
                     const std::string& value,
                     std::optional<std::chrono::milliseconds> ttl = std::nullopt) = 0;
    // Written as one batch; not atomic across keys.
    virtual void setMany(const std::vector<std::pair<std::string, std::string>>& entries) = 0;
    virtual bool del(const std::string& key) = 0;

    // SET key value NX PX ttl
    virtual bool setIfAbsent(const std::string& key,
                             const std::string& value,
                             std::chrono::milliseconds ttl) = 0;
    // Deletes key only while it still holds expected.
    virtual bool deleteIfEquals(const std::string& key, const std::string& expected) = 0;

    virtual std::vector<std::string> listRange(const std::string& key,
                                               std::int64_t start,
                                               std::int64_t stop) = 0;
    // Replaces the whole list in one transaction.
    virtual void listReplace(const std::string& key, const std::vector<std::string>& values) = 0;

    virtual std::vector<std::string> scan(const std::string& pattern) = 0;
};

// One row of the durable per-symbol table.
struct StoredCandleRow {
    std::int64_t time{0};
    std::string timeframe;
    std::string open;
    std::string high;
    std::string low;
    std::string close;
    std::string volume;
    std::optional<double> rsi14{};
    std::optional<double> atr{};
    std::optional<double> ema7{};
    std::optional<double> ma20{};
    std::optional<int> trendState{};
    std::optional<int> autoTrendState{};
};

// Connection-pooled durable store. Connection-class failures surface as
// StoreConnectionError, everything else as StoreDataError.
class ICandleStoreBackend {
public:
    virtual ~ICandleStoreBackend() = default;

    virtual void open() = 0;
    virtual void close() noexcept = 0;
    virtual bool isOpen() const noexcept = 0;
    virtual void ping() = 0;
    // Insert-or-update keyed by (time, timeframe); returns rows written.
    virtual std::size_t upsertRows(const std::string& table, const std::vector<StoredCandleRow>& rows) = 0;
};

// Sink for computed candles. Failures are reported, never thrown.
class ICandleSink {
public:
    virtual ~ICandleSink() = default;

    virtual bool upsert(const std::string& symbol, int minutes, const IndicatorSeries& candles) = 0;
};

}  // namespace domain
