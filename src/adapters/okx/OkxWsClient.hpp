#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "adapters/okx/OkxStreamHandler.hpp"

namespace adapters::okx {

struct OkxWsOptions {
    std::string host = "ws.okx.com";
    std::string port = "8443";
    std::string path = "/ws/v5/business";
    std::chrono::seconds heartbeat{20};
    std::chrono::seconds statusInterval{300};
    std::chrono::seconds reconnectCooldown{5};
};

// Long-lived OKX business stream. One worker thread runs a supervisor that
// connects, subscribes and then multiplexes receive, heartbeat and status
// duties on a single io_context until the connection drops; it reconnects
// after a fixed cooldown until stop().
class OkxWsClient {
public:
    OkxWsClient(OkxStreamHandler& handler, OkxWsOptions options = {});
    ~OkxWsClient();

    OkxWsClient(const OkxWsClient&) = delete;
    OkxWsClient& operator=(const OkxWsClient&) = delete;

    void start();
    void stop();

    bool running() const noexcept { return running_.load(std::memory_order_acquire); }

private:
    using WsStream = boost::beast::websocket::stream<
        boost::asio::ssl::stream<boost::beast::tcp_stream>>;

    struct Session {
        explicit Session(boost::asio::ssl::context& sslCtx);

        boost::asio::io_context ioc;
        WsStream ws;
        boost::asio::steady_timer heartbeat;
        boost::asio::steady_timer status;
        boost::beast::flat_buffer buffer;
        std::string closeReason;
    };

    void run_();
    void session_();
    void connect_(Session& session);
    void readLoop_(Session& session);
    void armHeartbeat_(Session& session);
    void armStatus_(Session& session);
    void cleanup_(Session& session);
    static void interrupt_(Session& session);

    OkxStreamHandler& handler_;
    OkxWsOptions options_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable wake_;
    std::shared_ptr<Session> active_;
};

}  // namespace adapters::okx
