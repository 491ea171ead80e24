#include "app/DistributedLock.hpp"

#include <array>
#include <cstdint>
#include <random>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"
#include "core/CacheKeys.hpp"

namespace app {

DistributedLock::DistributedLock(domain::ICacheStore& cache, std::chrono::milliseconds ttl)
    : cache_(cache), ttl_(ttl) {}

std::string DistributedLock::lockKey(const std::string& symbol, int minutes, const std::string& kind) {
    return core::keys::compose("lock", symbol, minutes) + ":" + kind;
}

std::string DistributedLock::newToken() {
    static constexpr char kHex[] = "0123456789abcdef";
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::array<std::uint64_t, 2> words{engine(), engine()};
    std::string token;
    token.reserve(32);
    for (auto word : words) {
        for (int shift = 60; shift >= 0; shift -= 4) {
            token.push_back(kHex[(word >> shift) & 0xF]);
        }
    }
    return token;
}

std::optional<std::string> DistributedLock::acquire(const std::string& key) {
    auto token = newToken();
    try {
        if (cache_.setIfAbsent(key, token, ttl_)) {
            LOG_DEBUG("lock acquired key=" << key);
            return token;
        }
    } catch (const domain::CacheError& ex) {
        LOG_WARN("lock acquire failed key=" << key << " error=" << ex.what());
    }
    csync::common::metrics::Registry::instance().incrementCounter("lock_refusals_total");
    return std::nullopt;
}

bool DistributedLock::release(const std::string& key, const std::string& token) {
    try {
        if (cache_.deleteIfEquals(key, token)) {
            LOG_DEBUG("lock released key=" << key);
            return true;
        }
        LOG_WARN("lock release skipped, owner changed or expired key=" << key);
    } catch (const domain::CacheError& ex) {
        LOG_WARN("lock release failed key=" << key << " error=" << ex.what());
    }
    return false;
}

ScopedLock::ScopedLock(DistributedLock& lock, std::string key)
    : lock_(lock), key_(std::move(key)), token_(lock_.acquire(key_)) {}

ScopedLock::~ScopedLock() {
    if (token_) {
        lock_.release(key_, *token_);
    }
}

}  // namespace app
