#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

namespace duckdb {
class DuckDB;
class Connection;
}  // namespace duckdb

namespace adapters::duckdb {

// Bounded set of connections over one database. Connections are opened
// lazily up to maxSize; minSize are opened up front.
class DuckConnectionPool {
public:
    class Lease {
    public:
        Lease(DuckConnectionPool& pool, std::unique_ptr<::duckdb::Connection> connection);
        ~Lease();

        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        ::duckdb::Connection& operator*() const noexcept { return *connection_; }
        ::duckdb::Connection* operator->() const noexcept { return connection_.get(); }

        // A discarded connection is dropped instead of returned to the pool.
        void discard() noexcept { discarded_ = true; }

    private:
        DuckConnectionPool* pool_;
        std::unique_ptr<::duckdb::Connection> connection_;
        bool discarded_{false};
    };

    DuckConnectionPool(::duckdb::DuckDB& database, std::size_t minSize, std::size_t maxSize);
    ~DuckConnectionPool();

    DuckConnectionPool(const DuckConnectionPool&) = delete;
    DuckConnectionPool& operator=(const DuckConnectionPool&) = delete;

    // Throws domain::StoreConnectionError when none frees up within timeout.
    Lease acquire(std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    std::size_t idle() const;
    std::size_t open() const;

private:
    void release_(std::unique_ptr<::duckdb::Connection> connection, bool discarded) noexcept;

    ::duckdb::DuckDB& database_;
    const std::size_t maxSize_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::vector<std::unique_ptr<::duckdb::Connection>> idle_;
    std::size_t open_{0};
};

}  // namespace adapters::duckdb
