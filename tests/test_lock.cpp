#include <chrono>
#include <iostream>
#include <string>

#include "adapters/memory/InMemoryCache.hpp"
#include "app/DistributedLock.hpp"
#include "common/Metrics.hpp"
#include "TestSupport.hpp"

namespace {

struct SteadyClock {
    std::chrono::steady_clock::time_point now{std::chrono::steady_clock::time_point{} + std::chrono::hours(1)};

    adapters::memory::InMemoryCache::Clock fn() {
        return [this] { return now; };
    }
};

int testKeyLayout() {
    EXPECT_TRUE(app::DistributedLock::lockKey("BTC-USDT-SWAP", 60, "bar_end") == "lock:BTC-USDT-SWAP:1h:bar_end",
                "unexpected lock key " << app::DistributedLock::lockKey("BTC-USDT-SWAP", 60, "bar_end"));
    return 0;
}

int testExclusiveOwnership() {
    adapters::memory::InMemoryCache cache;
    app::DistributedLock lock(cache);
    const std::string key = app::DistributedLock::lockKey("ETH-USDT-SWAP", 5, "current");

    const auto refusalsBefore = csync::common::metrics::Registry::instance().counter("lock_refusals_total");
    const auto first = lock.acquire(key);
    EXPECT_TRUE(first.has_value() && first->size() == 32, "first holder should get a 32-char token");
    EXPECT_TRUE(!lock.acquire(key).has_value(), "second holder must be refused");
    EXPECT_TRUE(csync::common::metrics::Registry::instance().counter("lock_refusals_total") == refusalsBefore + 1,
                "refusal should be counted");

    EXPECT_TRUE(!lock.release(key, "not-the-owner"), "release with a foreign token must be a no-op");
    EXPECT_TRUE(cache.get(key) == first, "foreign release must leave the lock in place");

    EXPECT_TRUE(lock.release(key, *first), "owner release should succeed");
    const auto again = lock.acquire(key);
    EXPECT_TRUE(again.has_value() && *again != *first, "lock should be free again with a fresh token");
    return 0;
}

int testTtlExpiry() {
    SteadyClock clock;
    adapters::memory::InMemoryCache cache(clock.fn());
    app::DistributedLock lock(cache, std::chrono::milliseconds(30000));
    const std::string key = app::DistributedLock::lockKey("SOL-USDT-SWAP", 1, "bar_end");

    const auto crashed = lock.acquire(key);
    EXPECT_TRUE(crashed.has_value(), "initial acquire");
    clock.now += std::chrono::seconds(29);
    EXPECT_TRUE(!lock.acquire(key).has_value(), "lock still held before the ttl");
    clock.now += std::chrono::seconds(2);
    const auto next = lock.acquire(key);
    EXPECT_TRUE(next.has_value(), "expired lock should be reacquirable");
    EXPECT_TRUE(!lock.release(key, *crashed), "stale owner cannot release the new holder's lock");
    EXPECT_TRUE(cache.get(key) == next, "new holder keeps the lock");
    return 0;
}

int testScopedLock() {
    adapters::memory::InMemoryCache cache;
    app::DistributedLock lock(cache);
    const std::string key = app::DistributedLock::lockKey("BTC-USDT-SWAP", 15, "initial");
    {
        app::ScopedLock outer(lock, key);
        EXPECT_TRUE(outer.owned(), "outer scope owns the lock");
        app::ScopedLock inner(lock, key);
        EXPECT_TRUE(!inner, "inner scope is refused");
    }
    EXPECT_TRUE(!cache.get(key).has_value(), "scope exit releases the lock");
    return 0;
}

}  // namespace

int main() {
    int failures = 0;
    failures += testKeyLayout();
    failures += testExclusiveOwnership();
    failures += testTtlExpiry();
    failures += testScopedLock();
    if (failures != 0) {
        std::cerr << failures << " lock test(s) failed\n";
        return 1;
    }
    return 0;
}
