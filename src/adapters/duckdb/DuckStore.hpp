#pragma once

#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace duckdb {
class DuckDB;
class Connection;
}  // namespace duckdb

namespace adapters::duckdb {

// Owns the database handle and the per-symbol table schema.
class DuckStore {
public:
    explicit DuckStore(std::string dbPath = "data/candles.duckdb");
    ~DuckStore();

    DuckStore(const DuckStore&) = delete;
    DuckStore& operator=(const DuckStore&) = delete;

    // Creates the parent directory and opens the database file.
    void open();
    void close() noexcept;
    bool isOpen() const noexcept { return static_cast<bool>(db_); }

    ::duckdb::DuckDB& database();

    // CREATE TABLE IF NOT EXISTS for table; remembered once it succeeds.
    void migrate(::duckdb::Connection& connection, const std::string& table);

    // Table names are interpolated into SQL, so only [a-z0-9_] is accepted.
    static bool isValidTableName(const std::string& table) noexcept;

    const std::string& path() const noexcept { return dbPath_; }

private:
    std::string dbPath_;
    std::unique_ptr<::duckdb::DuckDB> db_;
    std::mutex schemaMutex_;
    std::set<std::string> migrated_;
};

}  // namespace adapters::duckdb
