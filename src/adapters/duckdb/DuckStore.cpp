#include "adapters/duckdb/DuckStore.hpp"

#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <duckdb.hpp>

#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace fs = std::filesystem;

namespace adapters::duckdb {

DuckStore::DuckStore(std::string dbPath) : dbPath_(std::move(dbPath)) {}

DuckStore::~DuckStore() {
    close();
}

void DuckStore::open() {
    if (db_) {
        return;
    }
    const fs::path dbPath{dbPath_};
    if (dbPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(dbPath.parent_path(), ec);
        if (ec) {
            throw domain::StoreConnectionError("DuckStore: unable to create directory '" +
                                               dbPath.parent_path().string() + "': " + ec.message());
        }
    }

    try {
        db_ = std::make_unique<::duckdb::DuckDB>(dbPath.string());
    } catch (const std::exception& ex) {
        throw domain::StoreConnectionError("DuckStore: unable to open " + dbPath.string() + ": " + ex.what());
    }
    LOG_INFO("DuckStore opened " << dbPath.string());
}

void DuckStore::close() noexcept {
    {
        std::lock_guard<std::mutex> lock(schemaMutex_);
        migrated_.clear();
    }
    if (db_) {
        db_.reset();
        LOG_INFO("DuckStore closed " << dbPath_);
    }
}

::duckdb::DuckDB& DuckStore::database() {
    if (!db_) {
        throw domain::StoreConnectionError("DuckStore: database is not open");
    }
    return *db_;
}

bool DuckStore::isValidTableName(const std::string& table) noexcept {
    if (table.empty() || std::isdigit(static_cast<unsigned char>(table.front()))) {
        return false;
    }
    for (unsigned char ch : table) {
        if (!(std::islower(ch) || std::isdigit(ch) || ch == '_')) {
            return false;
        }
    }
    return true;
}

void DuckStore::migrate(::duckdb::Connection& connection, const std::string& table) {
    if (!isValidTableName(table)) {
        throw domain::StoreDataError("DuckStore: invalid table name '" + table + "'");
    }
    {
        std::lock_guard<std::mutex> lock(schemaMutex_);
        if (migrated_.count(table) != 0) {
            return;
        }
    }

    const std::string ddl = "CREATE TABLE IF NOT EXISTS " + table + R"SQL( (
            time TIMESTAMPTZ NOT NULL,
            timeframe VARCHAR NOT NULL,
            open DECIMAL(20,8),
            high DECIMAL(20,8),
            low DECIMAL(20,8),
            close DECIMAL(20,8),
            volume DECIMAL(28,8),
            rsi14 DOUBLE,
            atr DOUBLE,
            ema7 DOUBLE,
            ma20 DOUBLE,
            trend_state INTEGER,
            auto_trend_state INTEGER,
            PRIMARY KEY(time, timeframe)
        )
    )SQL";

    auto result = connection.Query(ddl);
    if (!result || result->HasError()) {
        const std::string errorMessage = result ? result->GetError() : std::string("unknown error creating table");
        throw domain::StoreDataError("DuckStore: migration of " + table + " failed: " + errorMessage);
    }

    std::lock_guard<std::mutex> lock(schemaMutex_);
    migrated_.insert(table);
    LOG_INFO("DuckStore table ready " << table);
}

}  // namespace adapters::duckdb
