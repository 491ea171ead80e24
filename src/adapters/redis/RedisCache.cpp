#include "adapters/redis/RedisCache.hpp"

#include <algorithm>
#include <array>
#include <set>
#include <sstream>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"

namespace adapters::redis {
namespace {

namespace net = boost::asio;
using tcp = net::ip::tcp;

// Owner-verified delete: removes the key only while it still holds ARGV[1].
constexpr const char* kCompareAndDeleteScript =
    "if redis.call('get', KEYS[1]) == ARGV[1] then return redis.call('del', KEYS[1]) else return 0 end";

constexpr std::size_t kScanCount = 200;

}  // namespace

RedisCache::RedisCache(RedisOptions options) : options_(std::move(options)) {
    if (options_.host.empty()) {
        throw std::invalid_argument("RedisCache requires a host");
    }
}

RedisCache::~RedisCache() {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect_();
}

void RedisCache::runUntilDone_(boost::system::error_code& result, const char* stage) {
    ioc_.restart();
    ioc_.run_for(options_.timeout);
    if (result == net::error::would_block) {
        boost::system::error_code ignored;
        if (socket_) {
            socket_->close(ignored);
        }
        ioc_.restart();
        ioc_.run();
        throw domain::CacheError(std::string{"Redis "} + stage + " timed out");
    }
    if (result) {
        throw domain::CacheError(std::string{"Redis "} + stage + " failed: " + result.message());
    }
}

void RedisCache::ensureConnected_() {
    if (socket_ && socket_->is_open()) {
        return;
    }

    tcp::resolver resolver(ioc_);
    boost::system::error_code ec;
    const auto endpoints = resolver.resolve(options_.host, std::to_string(options_.port), ec);
    if (ec) {
        throw domain::CacheError("Redis DNS resolution failed for " + options_.host + ": " + ec.message());
    }

    socket_ = std::make_unique<tcp::socket>(ioc_);
    boost::system::error_code result = net::error::would_block;
    net::async_connect(*socket_, endpoints, [&result](const boost::system::error_code& connectEc, const tcp::endpoint&) {
        result = connectEc;
    });
    runUntilDone_(result, "connect");

    socket_->set_option(tcp::no_delay(true), ec);
    readBuffer_.clear();
    LOG_INFO("Redis connected host=" << options_.host << " port=" << options_.port);

    if (!options_.password.empty()) {
        auto replies = roundTrip_(encodeCommand({"AUTH", options_.password}), 1);
        if (replies.front().isError()) {
            disconnect_();
            throw domain::CacheError("Redis AUTH rejected: " + replies.front().text);
        }
    }
}

void RedisCache::disconnect_() noexcept {
    if (!socket_) {
        return;
    }
    boost::system::error_code ignored;
    socket_->shutdown(tcp::socket::shutdown_both, ignored);
    socket_->close(ignored);
    socket_.reset();
    readBuffer_.clear();
}

std::vector<RespValue> RedisCache::roundTrip_(const std::string& payload, std::size_t replies) {
    boost::system::error_code result = net::error::would_block;
    net::async_write(*socket_, net::buffer(payload), [&result](const boost::system::error_code& writeEc, std::size_t) {
        result = writeEc;
    });
    runUntilDone_(result, "write");

    std::vector<RespValue> values;
    values.reserve(replies);
    std::array<char, 16384> chunk{};
    while (values.size() < replies) {
        std::size_t consumed = 0;
        if (auto reply = parseReply(readBuffer_, consumed)) {
            values.push_back(std::move(*reply));
            readBuffer_.erase(0, consumed);
            continue;
        }

        std::size_t received = 0;
        result = net::error::would_block;
        socket_->async_read_some(net::buffer(chunk),
                                 [&result, &received](const boost::system::error_code& readEc, std::size_t bytes) {
                                     result = readEc;
                                     received = bytes;
                                 });
        runUntilDone_(result, "read");
        readBuffer_.append(chunk.data(), received);
    }
    return values;
}

std::vector<RespValue> RedisCache::executePipeline(const std::vector<std::vector<std::string>>& commands) {
    std::string payload;
    for (const auto& command : commands) {
        payload += encodeCommand(command);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (int attempt = 1;; ++attempt) {
        try {
            ensureConnected_();
            return roundTrip_(payload, commands.size());
        } catch (const domain::CacheError& ex) {
            disconnect_();
            csync::common::metrics::Registry::instance().incrementCounter("cache_reconnects_total");
            if (attempt >= 2) {
                throw;
            }
            LOG_WARN("Redis command failed, reconnecting attempt=" << attempt << " error=" << ex.what());
        }
    }
}

RespValue RedisCache::execute(const std::vector<std::string>& args) {
    auto replies = executePipeline({args});
    return std::move(replies.front());
}

RespValue RedisCache::expectNoError(RespValue reply, const std::string& command) {
    if (reply.isError()) {
        throw domain::CacheError("Redis " + command + " error: " + reply.text);
    }
    return reply;
}

bool RedisCache::ping() {
    try {
        const auto reply = execute({"PING"});
        return reply.type == RespValue::Type::SimpleString && reply.text == "PONG";
    } catch (const domain::CacheError& ex) {
        LOG_WARN("Redis ping failed: " << ex.what());
        return false;
    }
}

std::optional<std::string> RedisCache::get(const std::string& key) {
    auto reply = expectNoError(execute({"GET", key}), "GET");
    if (reply.isNull()) {
        return std::nullopt;
    }
    return std::move(reply.text);
}

void RedisCache::set(const std::string& key,
                     const std::string& value,
                     std::optional<std::chrono::milliseconds> ttl) {
    std::vector<std::string> args{"SET", key, value};
    if (ttl) {
        args.emplace_back("PX");
        args.push_back(std::to_string(ttl->count()));
    }
    expectNoError(execute(args), "SET");
}

void RedisCache::setMany(const std::vector<std::pair<std::string, std::string>>& entries) {
    if (entries.empty()) {
        return;
    }
    std::vector<std::vector<std::string>> commands;
    commands.reserve(entries.size());
    for (const auto& [key, value] : entries) {
        commands.push_back({"SET", key, value});
    }
    for (auto& reply : executePipeline(commands)) {
        expectNoError(std::move(reply), "SET");
    }
}

bool RedisCache::del(const std::string& key) {
    const auto reply = expectNoError(execute({"DEL", key}), "DEL");
    return reply.integer > 0;
}

bool RedisCache::setIfAbsent(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) {
    const auto reply =
        expectNoError(execute({"SET", key, value, "NX", "PX", std::to_string(ttl.count())}), "SET NX");
    return reply.isOk();
}

bool RedisCache::deleteIfEquals(const std::string& key, const std::string& expected) {
    const auto reply = expectNoError(execute({"EVAL", kCompareAndDeleteScript, "1", key, expected}), "EVAL");
    return reply.type == RespValue::Type::Integer && reply.integer == 1;
}

std::vector<std::string> RedisCache::listRange(const std::string& key, std::int64_t start, std::int64_t stop) {
    auto reply = expectNoError(execute({"LRANGE", key, std::to_string(start), std::to_string(stop)}), "LRANGE");
    std::vector<std::string> values;
    values.reserve(reply.elements.size());
    for (auto& element : reply.elements) {
        values.push_back(std::move(element.text));
    }
    return values;
}

void RedisCache::listReplace(const std::string& key, const std::vector<std::string>& values) {
    std::vector<std::vector<std::string>> commands;
    commands.push_back({"MULTI"});
    commands.push_back({"DEL", key});
    if (!values.empty()) {
        std::vector<std::string> push;
        push.reserve(values.size() + 2);
        push.emplace_back("RPUSH");
        push.push_back(key);
        push.insert(push.end(), values.begin(), values.end());
        commands.push_back(std::move(push));
    }
    commands.push_back({"EXEC"});

    auto replies = executePipeline(commands);
    const auto& exec = replies.back();
    if (exec.isError() || exec.isNull()) {
        throw domain::CacheError("Redis list replace aborted for " + key + ": " + exec.text);
    }
    for (const auto& element : exec.elements) {
        if (element.isError()) {
            throw domain::CacheError("Redis list replace failed for " + key + ": " + element.text);
        }
    }
}

std::vector<std::string> RedisCache::scan(const std::string& pattern) {
    std::set<std::string> keys;
    std::string cursor = "0";
    do {
        auto reply = expectNoError(
            execute({"SCAN", cursor, "MATCH", pattern, "COUNT", std::to_string(kScanCount)}), "SCAN");
        if (reply.type != RespValue::Type::Array || reply.elements.size() != 2) {
            throw domain::CacheError("Redis SCAN returned an unexpected reply");
        }
        cursor = reply.elements[0].text;
        for (auto& element : reply.elements[1].elements) {
            keys.insert(std::move(element.text));
        }
    } while (cursor != "0");
    return std::vector<std::string>(keys.begin(), keys.end());
}

}  // namespace adapters::redis
