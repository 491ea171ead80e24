#include "adapters/duckdb/DuckConnectionPool.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <duckdb.hpp>

#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace adapters::duckdb {

DuckConnectionPool::Lease::Lease(DuckConnectionPool& pool, std::unique_ptr<::duckdb::Connection> connection)
    : pool_(&pool), connection_(std::move(connection)) {}

DuckConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), connection_(std::move(other.connection_)), discarded_(other.discarded_) {
    other.pool_ = nullptr;
}

DuckConnectionPool::Lease::~Lease() {
    if (pool_ != nullptr && connection_) {
        pool_->release_(std::move(connection_), discarded_);
    }
}

DuckConnectionPool::DuckConnectionPool(::duckdb::DuckDB& database, std::size_t minSize, std::size_t maxSize)
    : database_(database), maxSize_(maxSize) {
    if (maxSize == 0 || minSize > maxSize) {
        throw std::invalid_argument("DuckConnectionPool requires 0 < min <= max");
    }
    try {
        for (std::size_t i = 0; i < minSize; ++i) {
            idle_.push_back(std::make_unique<::duckdb::Connection>(database_));
            ++open_;
        }
    } catch (const std::exception& ex) {
        throw domain::StoreConnectionError(std::string{"DuckConnectionPool: "} + ex.what());
    }
    LOG_INFO("DuckConnectionPool ready min=" << minSize << " max=" << maxSize);
}

DuckConnectionPool::~DuckConnectionPool() {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.clear();
}

DuckConnectionPool::Lease DuckConnectionPool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!available_.wait_for(lock, timeout, [this]() { return !idle_.empty() || open_ < maxSize_; })) {
        throw domain::StoreConnectionError("DuckConnectionPool: no connection available within " +
                                           std::to_string(timeout.count()) + "ms");
    }
    if (!idle_.empty()) {
        auto connection = std::move(idle_.back());
        idle_.pop_back();
        return Lease(*this, std::move(connection));
    }

    ++open_;
    lock.unlock();
    try {
        return Lease(*this, std::make_unique<::duckdb::Connection>(database_));
    } catch (const std::exception& ex) {
        {
            std::lock_guard<std::mutex> relock(mutex_);
            --open_;
        }
        available_.notify_one();
        throw domain::StoreConnectionError(std::string{"DuckConnectionPool: "} + ex.what());
    }
}

void DuckConnectionPool::release_(std::unique_ptr<::duckdb::Connection> connection, bool discarded) noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (discarded) {
            --open_;
        } else {
            idle_.push_back(std::move(connection));
        }
    }
    available_.notify_one();
}

std::size_t DuckConnectionPool::idle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

std::size_t DuckConnectionPool::open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

}  // namespace adapters::duckdb
