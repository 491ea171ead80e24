#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "domain/Ports.hpp"

namespace app {

// Mutual exclusion across processes sharing one cache. A lock is a key
// holding a random owner token with a TTL; release only deletes the key
// while it still carries the caller's token.
class DistributedLock {
public:
    explicit DistributedLock(domain::ICacheStore& cache,
                             std::chrono::milliseconds ttl = std::chrono::milliseconds{30000});

    std::optional<std::string> acquire(const std::string& key);
    bool release(const std::string& key, const std::string& token);

    static std::string lockKey(const std::string& symbol, int minutes, const std::string& kind);

    std::chrono::milliseconds ttl() const noexcept { return ttl_; }

private:
    static std::string newToken();

    domain::ICacheStore& cache_;
    std::chrono::milliseconds ttl_;
};

class ScopedLock {
public:
    ScopedLock(DistributedLock& lock, std::string key);
    ~ScopedLock();

    ScopedLock(const ScopedLock&) = delete;
    ScopedLock& operator=(const ScopedLock&) = delete;

    bool owned() const noexcept { return token_.has_value(); }
    explicit operator bool() const noexcept { return owned(); }

private:
    DistributedLock& lock_;
    std::string key_;
    std::optional<std::string> token_;
};

}  // namespace app
