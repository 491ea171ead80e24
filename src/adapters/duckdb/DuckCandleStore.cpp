#include "adapters/duckdb/DuckCandleStore.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <duckdb.hpp>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"

namespace adapters::duckdb {
namespace {

// DuckDB exposes its own vector alias; Execute(values) needs it.
using DuckdbValueVector = ::duckdb::vector<::duckdb::Value>;

constexpr const char* kUpsertTail = R"SQL(
    (time, timeframe, open, high, low, close, volume,
     rsi14, atr, ema7, ma20, trend_state, auto_trend_state)
    VALUES (to_timestamp(?), ?,
            CAST(? AS DECIMAL(20,8)), CAST(? AS DECIMAL(20,8)),
            CAST(? AS DECIMAL(20,8)), CAST(? AS DECIMAL(20,8)),
            CAST(? AS DECIMAL(28,8)),
            ?, ?, ?, ?, ?, ?)
    ON CONFLICT (time, timeframe) DO UPDATE SET
        open = excluded.open,
        high = excluded.high,
        low = excluded.low,
        close = excluded.close,
        volume = excluded.volume,
        rsi14 = excluded.rsi14,
        atr = excluded.atr,
        ema7 = excluded.ema7,
        ma20 = excluded.ma20,
        trend_state = excluded.trend_state,
        auto_trend_state = excluded.auto_trend_state
)SQL";

bool isConnectionClass(::duckdb::ExceptionType type) {
    switch (type) {
    case ::duckdb::ExceptionType::IO:
    case ::duckdb::ExceptionType::CONNECTION:
    case ::duckdb::ExceptionType::FATAL:
    case ::duckdb::ExceptionType::INTERRUPT:
        return true;
    default:
        return false;
    }
}

[[noreturn]] void throwStoreError(::duckdb::ExceptionType type, const std::string& message) {
    if (isConnectionClass(type)) {
        throw domain::StoreConnectionError(message);
    }
    throw domain::StoreDataError(message);
}

::duckdb::Value nullableDouble(const std::optional<double>& value) {
    return value ? ::duckdb::Value::DOUBLE(*value) : ::duckdb::Value(::duckdb::LogicalType::DOUBLE);
}

::duckdb::Value nullableInt(const std::optional<int>& value) {
    return value ? ::duckdb::Value::INTEGER(*value) : ::duckdb::Value(::duckdb::LogicalType::INTEGER);
}

}  // namespace

DuckCandleStore::DuckCandleStore(std::string dbPath, DuckPoolOptions pool)
    : store_(std::move(dbPath)), poolOptions_(pool) {}

DuckCandleStore::~DuckCandleStore() {
    close();
}

void DuckCandleStore::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pool_) {
        return;
    }
    store_.open();
    try {
        pool_ = std::make_unique<DuckConnectionPool>(store_.database(), poolOptions_.minSize, poolOptions_.maxSize);
    } catch (const std::invalid_argument& ex) {
        store_.close();
        throw domain::StoreDataError(ex.what());
    } catch (const domain::StoreConnectionError&) {
        store_.close();
        throw;
    }
}

void DuckCandleStore::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    pool_.reset();
    store_.close();
}

bool DuckCandleStore::isOpen() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(pool_);
}

DuckConnectionPool::Lease DuckCandleStore::lease_() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pool_) {
        throw domain::StoreConnectionError("DuckCandleStore: store is closed");
    }
    return pool_->acquire();
}

void DuckCandleStore::ping() {
    auto connection = lease_();
    std::unique_ptr<::duckdb::MaterializedQueryResult> result;
    try {
        result = connection->Query("SELECT 1");
    } catch (const std::exception& ex) {
        connection.discard();
        throw domain::StoreConnectionError(std::string{"DuckCandleStore ping failed: "} + ex.what());
    }
    if (!result || result->HasError()) {
        connection.discard();
        throw domain::StoreConnectionError("DuckCandleStore ping failed: " +
                                           (result ? result->GetError() : std::string{"no result"}));
    }
}

std::size_t DuckCandleStore::upsertRows(const std::string& table, const std::vector<domain::StoredCandleRow>& rows) {
    if (rows.empty()) {
        return 0;
    }
    if (!DuckStore::isValidTableName(table)) {
        throw domain::StoreDataError("DuckCandleStore: invalid table name '" + table + "'");
    }

    auto connection = lease_();
    csync::common::metrics::Registry::ScopedTimer timer("duckdb_upsert");

    bool inTransaction = false;
    auto rollback = [&]() {
        if (!inTransaction) {
            return;
        }
        inTransaction = false;
        try {
            connection->Rollback();
        } catch (const std::exception& ex) {
            LOG_WARN("DuckCandleStore rollback failed table=" << table << " error=" << ex.what());
            connection.discard();
        }
    };

    try {
        store_.migrate(*connection, table);

        connection->BeginTransaction();
        inTransaction = true;

        auto statement = connection->Prepare("INSERT INTO " + table + kUpsertTail);
        if (!statement || statement->HasError()) {
            const std::string errorMessage = statement ? statement->GetError() : std::string{"failed to prepare"};
            throw domain::StoreDataError("DuckCandleStore prepare failed table=" + table + ": " + errorMessage);
        }

        DuckdbValueVector parameters;
        parameters.reserve(13);
        for (const auto& row : rows) {
            parameters.clear();
            parameters.emplace_back(::duckdb::Value::BIGINT(row.time));
            parameters.emplace_back(row.timeframe);
            parameters.emplace_back(row.open);
            parameters.emplace_back(row.high);
            parameters.emplace_back(row.low);
            parameters.emplace_back(row.close);
            parameters.emplace_back(row.volume);
            parameters.push_back(nullableDouble(row.rsi14));
            parameters.push_back(nullableDouble(row.atr));
            parameters.push_back(nullableDouble(row.ema7));
            parameters.push_back(nullableDouble(row.ma20));
            parameters.push_back(nullableInt(row.trendState));
            parameters.push_back(nullableInt(row.autoTrendState));

            auto result = statement->Execute(parameters);
            if (!result || result->HasError()) {
                const std::string errorMessage = result ? result->GetError() : std::string{"failed to execute"};
                throwStoreError(result ? result->GetErrorType() : ::duckdb::ExceptionType::CONNECTION,
                      "DuckCandleStore upsert failed table=" + table + ": " + errorMessage);
            }
        }

        connection->Commit();
        inTransaction = false;
    } catch (const domain::StoreConnectionError&) {
        rollback();
        connection.discard();
        throw;
    } catch (const domain::StoreDataError&) {
        rollback();
        throw;
    } catch (const ::duckdb::IOException& ex) {
        rollback();
        connection.discard();
        throw domain::StoreConnectionError(std::string{"DuckCandleStore IO error: "} + ex.what());
    } catch (const ::duckdb::ConnectionException& ex) {
        rollback();
        connection.discard();
        throw domain::StoreConnectionError(std::string{"DuckCandleStore connection error: "} + ex.what());
    } catch (const std::exception& ex) {
        rollback();
        throw domain::StoreDataError(std::string{"DuckCandleStore error table="} + table + ": " + ex.what());
    }

    LOG_DEBUG("DuckCandleStore upserted table=" << table << " rows=" << rows.size());
    return rows.size();
}

}  // namespace adapters::duckdb
