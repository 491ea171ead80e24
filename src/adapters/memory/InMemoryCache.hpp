#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "domain/Ports.hpp"

namespace adapters::memory {

// Process-local cache with the same semantics as the Redis adapter,
// including key expiry. Backs `--cache memory` and the test suite.
class InMemoryCache : public domain::ICacheStore {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    InMemoryCache();
    explicit InMemoryCache(Clock clock);

    bool ping() override;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key,
             const std::string& value,
             std::optional<std::chrono::milliseconds> ttl = std::nullopt) override;
    void setMany(const std::vector<std::pair<std::string, std::string>>& entries) override;
    bool del(const std::string& key) override;

    bool setIfAbsent(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) override;
    bool deleteIfEquals(const std::string& key, const std::string& expected) override;

    std::vector<std::string> listRange(const std::string& key, std::int64_t start, std::int64_t stop) override;
    void listReplace(const std::string& key, const std::vector<std::string>& values) override;

    std::vector<std::string> scan(const std::string& pattern) override;

    static bool globMatch(const std::string& pattern, const std::string& text);

private:
    struct Entry {
        std::string value;
        std::vector<std::string> list;
        bool isList{false};
        std::optional<std::chrono::steady_clock::time_point> expiresAt{};
    };

    // Caller holds mutex_.
    Entry* findLive(const std::string& key);
    static std::pair<std::size_t, std::size_t> resolveRange(std::size_t size, std::int64_t start, std::int64_t stop);

    Clock clock_;
    std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace adapters::memory
