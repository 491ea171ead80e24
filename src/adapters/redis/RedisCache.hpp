#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "adapters/redis/RespProtocol.hpp"
#include "domain/Ports.hpp"

namespace adapters::redis {

struct RedisOptions {
    std::string host = "127.0.0.1";
    std::uint16_t port = 6379;
    std::string password;
    std::chrono::milliseconds timeout{5000};
};

// Blocking RESP2 client over one TCP connection. Commands are serialized
// by a mutex; a transport failure drops the connection and the command is
// retried once on a fresh one.
class RedisCache : public domain::ICacheStore {
public:
    explicit RedisCache(RedisOptions options);
    ~RedisCache() override;

    RedisCache(const RedisCache&) = delete;
    RedisCache& operator=(const RedisCache&) = delete;

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

private:
    RespValue execute(const std::vector<std::string>& args);
    std::vector<RespValue> executePipeline(const std::vector<std::vector<std::string>>& commands);

    void ensureConnected_();
    void disconnect_() noexcept;
    std::vector<RespValue> roundTrip_(const std::string& payload, std::size_t replies);
    void runUntilDone_(boost::system::error_code& result, const char* stage);

    static RespValue expectNoError(RespValue reply, const std::string& command);

    RedisOptions options_;
    std::mutex mutex_;
    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::ip::tcp::socket> socket_;
    std::string readBuffer_;
};

}  // namespace adapters::redis
