#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "duckdb.hpp"

#include "adapters/duckdb/DuckCandleStore.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "domain/Errors.hpp"

namespace {

domain::StoredCandleRow makeRow(std::int64_t time, const std::string& close) {
    domain::StoredCandleRow row;
    row.time = time;
    row.timeframe = "1h";
    row.open = "100.00000000";
    row.high = "110.00000000";
    row.low = "90.00000000";
    row.close = close;
    row.volume = "12.50000000";
    row.rsi14 = 48.5;
    row.trendState = 1;
    row.autoTrendState = -1;
    return row;
}

}  // namespace

int main() {
    const std::filesystem::path dir = "/tmp/candlesync-duck-test";
    const std::string dbPath = (dir / "candles.duckdb").string();
    std::filesystem::remove_all(dir);

    if (!adapters::duckdb::DuckStore::isValidTableName("btc_usdt") ||
        adapters::duckdb::DuckStore::isValidTableName("btc-usdt") ||
        adapters::duckdb::DuckStore::isValidTableName("1btc") ||
        adapters::duckdb::DuckStore::isValidTableName("x; DROP TABLE y")) {
        std::cerr << "Table name validation is wrong\n";
        return 1;
    }

    try {
        adapters::duckdb::DuckCandleStore store(dbPath, adapters::duckdb::DuckPoolOptions{1, 2});

        bool closedThrew = false;
        try {
            store.ping();
        } catch (const domain::StoreConnectionError&) {
            closedThrew = true;
        }
        if (!closedThrew) {
            std::cerr << "Ping on a closed store should be a connection error\n";
            return 1;
        }

        store.open();
        store.ping();
        if (!std::filesystem::exists(dbPath)) {
            std::cerr << "Database file should be created on open\n";
            return 1;
        }

        const std::int64_t t0 = 1704067200;
        if (store.upsertRows("btc_usdt", {makeRow(t0, "101.00000000"), makeRow(t0 + 3600, "102.00000000")}) != 2) {
            std::cerr << "First upsert should write two rows\n";
            return 1;
        }
        // Same key again: the newer values win and no duplicate row appears.
        store.upsertRows("btc_usdt", {makeRow(t0 + 3600, "105.25000000"), makeRow(t0 + 7200, "103.00000000")});

        bool dataThrew = false;
        try {
            store.upsertRows("BTC-USDT", {makeRow(t0, "1.00000000")});
        } catch (const domain::StoreDataError&) {
            dataThrew = true;
        }
        if (!dataThrew) {
            std::cerr << "Invalid table name should be a data error\n";
            return 1;
        }
        store.close();

        duckdb::DuckDB db(dbPath);
        duckdb::Connection con(db);
        auto count = con.Query("SELECT COUNT(*) FROM btc_usdt");
        if (!count || count->HasError()) {
            std::cerr << "Query error: " << (count ? count->GetError() : std::string{"no result"}) << "\n";
            return 1;
        }
        if (count->GetValue(0, 0).GetValue<int64_t>() != 3) {
            std::cerr << "Expected 3 rows after upserts, got " << count->GetValue(0, 0).ToString() << "\n";
            return 1;
        }

        auto updated = con.Query(
            "SELECT CAST(close AS DOUBLE), rsi14, atr, auto_trend_state FROM btc_usdt "
            "WHERE time = to_timestamp(1704070800) AND timeframe = '1h'");
        if (!updated || updated->HasError() || updated->RowCount() != 1) {
            std::cerr << "Updated row not found\n";
            return 1;
        }
        if (updated->GetValue(0, 0).GetValue<double>() != 105.25) {
            std::cerr << "Upsert should overwrite close, got " << updated->GetValue(0, 0).ToString() << "\n";
            return 1;
        }
        if (updated->GetValue(1, 0).GetValue<double>() != 48.5 || !updated->GetValue(2, 0).IsNull() ||
            updated->GetValue(3, 0).GetValue<int32_t>() != -1) {
            std::cerr << "Indicator columns not stored as expected\n";
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Exception: " << ex.what() << "\n";
        return 1;
    }

    std::filesystem::remove_all(dir);
    return 0;
}
