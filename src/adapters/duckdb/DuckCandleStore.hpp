#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "adapters/duckdb/DuckConnectionPool.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "domain/Ports.hpp"

namespace adapters::duckdb {

struct DuckPoolOptions {
    std::size_t minSize = 1;
    std::size_t maxSize = 10;
};

// Durable candle store on DuckDB: one table per normalized symbol, rows
// keyed by (time, timeframe). IO and connection failures surface as
// StoreConnectionError; everything else as StoreDataError.
class DuckCandleStore : public domain::ICandleStoreBackend {
public:
    explicit DuckCandleStore(std::string dbPath, DuckPoolOptions pool = {});
    ~DuckCandleStore() override;

    void open() override;
    void close() noexcept override;
    bool isOpen() const noexcept override;
    void ping() override;
    std::size_t upsertRows(const std::string& table, const std::vector<domain::StoredCandleRow>& rows) override;

private:
    DuckConnectionPool::Lease lease_();

    DuckStore store_;
    DuckPoolOptions poolOptions_;
    mutable std::mutex mutex_;
    std::unique_ptr<DuckConnectionPool> pool_;
};

}  // namespace adapters::duckdb
