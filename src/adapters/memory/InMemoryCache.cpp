#include "adapters/memory/InMemoryCache.hpp"

#include <algorithm>
#include <utility>

#include "domain/Errors.hpp"

namespace adapters::memory {

InMemoryCache::InMemoryCache() : InMemoryCache([] { return std::chrono::steady_clock::now(); }) {}

InMemoryCache::InMemoryCache(Clock clock) : clock_(std::move(clock)) {}

bool InMemoryCache::ping() {
    return true;
}

InMemoryCache::Entry* InMemoryCache::findLive(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    if (it->second.expiresAt && clock_() >= *it->second.expiresAt) {
        entries_.erase(it);
        return nullptr;
    }
    return &it->second;
}

std::optional<std::string> InMemoryCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = findLive(key);
    if (entry == nullptr) {
        return std::nullopt;
    }
    if (entry->isList) {
        throw domain::CacheError("WRONGTYPE key holds a list: " + key);
    }
    return entry->value;
}

void InMemoryCache::set(const std::string& key,
                        const std::string& value,
                        std::optional<std::chrono::milliseconds> ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry entry{};
    entry.value = value;
    if (ttl) {
        entry.expiresAt = clock_() + *ttl;
    }
    entries_[key] = std::move(entry);
}

void InMemoryCache::setMany(const std::vector<std::pair<std::string, std::string>>& entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : entries) {
        Entry entry{};
        entry.value = value;
        entries_[key] = std::move(entry);
    }
}

bool InMemoryCache::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (findLive(key) == nullptr) {
        return false;
    }
    entries_.erase(key);
    return true;
}

bool InMemoryCache::setIfAbsent(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (findLive(key) != nullptr) {
        return false;
    }
    Entry entry{};
    entry.value = value;
    entry.expiresAt = clock_() + ttl;
    entries_[key] = std::move(entry);
    return true;
}

bool InMemoryCache::deleteIfEquals(const std::string& key, const std::string& expected) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = findLive(key);
    if (entry == nullptr || entry->isList || entry->value != expected) {
        return false;
    }
    entries_.erase(key);
    return true;
}

std::pair<std::size_t, std::size_t> InMemoryCache::resolveRange(std::size_t size,
                                                                std::int64_t start,
                                                                std::int64_t stop) {
    const auto length = static_cast<std::int64_t>(size);
    if (start < 0) {
        start = std::max<std::int64_t>(length + start, 0);
    }
    if (stop < 0) {
        stop = length + stop;
    }
    stop = std::min(stop, length - 1);
    if (start > stop || start >= length) {
        return {0, 0};
    }
    return {static_cast<std::size_t>(start), static_cast<std::size_t>(stop + 1)};
}

std::vector<std::string> InMemoryCache::listRange(const std::string& key, std::int64_t start, std::int64_t stop) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = findLive(key);
    if (entry == nullptr) {
        return {};
    }
    if (!entry->isList) {
        throw domain::CacheError("WRONGTYPE key holds a string: " + key);
    }
    const auto [from, to] = resolveRange(entry->list.size(), start, stop);
    return std::vector<std::string>(entry->list.begin() + static_cast<std::ptrdiff_t>(from),
                                    entry->list.begin() + static_cast<std::ptrdiff_t>(to));
}

void InMemoryCache::listReplace(const std::string& key, const std::vector<std::string>& values) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (values.empty()) {
        entries_.erase(key);
        return;
    }
    Entry entry{};
    entry.isList = true;
    entry.list = values;
    entries_[key] = std::move(entry);
}

std::vector<std::string> InMemoryCache::scan(const std::string& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();
    std::vector<std::string> keys;
    for (const auto& [key, entry] : entries_) {
        if (entry.expiresAt && now >= *entry.expiresAt) {
            continue;
        }
        if (globMatch(pattern, key)) {
            keys.push_back(key);
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

bool InMemoryCache::globMatch(const std::string& pattern, const std::string& text) {
    std::size_t p = 0;
    std::size_t t = 0;
    std::size_t starP = std::string::npos;
    std::size_t starT = 0;
    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            starP = p++;
            starT = t;
        } else if (starP != std::string::npos) {
            p = starP + 1;
            t = ++starT;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

}  // namespace adapters::memory
