#include "adapters/okx/OkxWsClient.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/rfc2818_verification.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace adapters::okx {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

namespace {
constexpr const char* kPing = "ping";
constexpr std::chrono::seconds kConnectTimeout{10};
constexpr std::chrono::seconds kCleanupTimeout{3};

std::runtime_error make_error(const std::string& message) {
    return std::runtime_error("OkxWsClient: " + message);
}
}  // namespace

OkxWsClient::Session::Session(ssl::context& sslCtx)
    : ws(ioc, sslCtx), heartbeat(ioc), status(ioc) {}

OkxWsClient::OkxWsClient(OkxStreamHandler& handler, OkxWsOptions options)
    : handler_(handler), options_(std::move(options)) {}

OkxWsClient::~OkxWsClient() {
    stop();
}

void OkxWsClient::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        throw make_error("already started");
    }
    worker_ = std::thread([this]() { run_(); });
}

void OkxWsClient::stop() {
    running_.store(false, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_) {
            auto session = active_;
            net::post(session->ioc, [session]() { interrupt_(*session); });
        }
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void OkxWsClient::run_() {
    csync::log::setThreadName("stream");
    LOG_INFO("OKX stream worker starting channels=" << handler_.channelCount());
    auto& metrics = csync::common::metrics::Registry::instance();

    while (running_.load(std::memory_order_acquire)) {
        try {
            session_();
        } catch (const std::exception& ex) {
            LOG_WARN("OKX stream connection error: " << ex.what());
        }
        handler_.setConnectionStatus(false);

        if (!running_.load(std::memory_order_acquire)) {
            break;
        }
        metrics.incrementCounter("ws_reconnects_total");
        LOG_INFO("OKX stream reconnecting in " << options_.reconnectCooldown.count() << "s");
        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait_for(lock, options_.reconnectCooldown, [this]() {
            return !running_.load(std::memory_order_acquire);
        });
    }
    LOG_INFO("OKX stream worker stopped");
}

void OkxWsClient::session_() {
    ssl::context sslCtx(ssl::context::tls_client);
    sslCtx.set_default_verify_paths();
    sslCtx.set_verify_mode(ssl::verify_peer);

    auto session = std::make_shared<Session>(sslCtx);
    connect_(*session);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load(std::memory_order_acquire)) {
            cleanup_(*session);
            return;
        }
        active_ = session;
    }

    handler_.setConnectionStatus(true);
    readLoop_(*session);
    armHeartbeat_(*session);
    armStatus_(*session);
    session->ioc.run();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.reset();
    }
    LOG_WARN("OKX stream disconnected: " << (session->closeReason.empty() ? "stopped" : session->closeReason));
    cleanup_(*session);
}

void OkxWsClient::connect_(Session& session) {
    auto& ws = session.ws;
    ws.next_layer().set_verify_callback(ssl::rfc2818_verification(options_.host));
    if (!::SSL_set_tlsext_host_name(ws.next_layer().native_handle(), options_.host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "Failed to set SNI host name to '" << options_.host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw make_error(oss.str());
    }

    beast::error_code ec;
    net::ip::tcp::resolver resolver(session.ioc);
    const auto results = resolver.resolve(options_.host, options_.port, ec);
    if (ec) {
        throw make_error("DNS resolve failed: " + ec.message());
    }

    LOG_INFO("OKX stream connecting to " << options_.host << ":" << options_.port << options_.path);
    auto& tcp = beast::get_lowest_layer(ws);
    tcp.expires_after(kConnectTimeout);
    tcp.connect(results, ec);
    if (ec) {
        throw make_error("connect failed: " + ec.message());
    }
    ws.next_layer().handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw make_error("TLS handshake failed: " + ec.message());
    }
    tcp.expires_never();

    auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
    // The text heartbeat is answered with "pong", so two missed beats mean a dead link.
    timeouts.idle_timeout = options_.heartbeat * 2;
    ws.set_option(timeouts);
    ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "CandleSync-OkxWsClient");
    }));

    ws.handshake(options_.host + ":" + options_.port, options_.path, ec);
    if (ec) {
        throw make_error("WebSocket handshake failed: " + ec.message());
    }

    ws.text(true);
    const auto subscribe = handler_.subscribeMessage();
    ws.write(net::buffer(subscribe), ec);
    if (ec) {
        throw make_error("subscribe failed: " + ec.message());
    }
    LOG_INFO("OKX stream connected, subscribed channels=" << handler_.channelCount());
}

void OkxWsClient::readLoop_(Session& session) {
    session.ws.async_read(session.buffer, [this, &session](const beast::error_code& ec, std::size_t) {
        if (ec) {
            if (ec == websocket::error::closed) {
                session.closeReason = "closed by server";
            } else if (ec != net::error::operation_aborted) {
                session.closeReason = "read failed: " + ec.message();
            }
            session.heartbeat.cancel();
            session.status.cancel();
            return;
        }

        const std::string payload = beast::buffers_to_string(session.buffer.cdata());
        session.buffer.consume(session.buffer.size());
        try {
            handler_.handleMessage(payload);
        } catch (const std::exception& ex) {
            LOG_WARN("OKX stream failed to process message: " << ex.what());
        }
        if (running_.load(std::memory_order_acquire)) {
            readLoop_(session);
        }
    });
}

void OkxWsClient::armHeartbeat_(Session& session) {
    session.heartbeat.expires_after(options_.heartbeat);
    session.heartbeat.async_wait([this, &session](const beast::error_code& ec) {
        if (ec) {
            return;
        }
        session.ws.async_write(net::buffer(kPing, 4), [this, &session](const beast::error_code& writeEc, std::size_t) {
            if (writeEc) {
                if (writeEc != net::error::operation_aborted) {
                    session.closeReason = "heartbeat failed: " + writeEc.message();
                    interrupt_(session);
                }
                return;
            }
            armHeartbeat_(session);
        });
    });
}

void OkxWsClient::armStatus_(Session& session) {
    session.status.expires_after(options_.statusInterval);
    session.status.async_wait([this, &session](const beast::error_code& ec) {
        if (ec) {
            return;
        }
        handler_.reportStatus();
        armStatus_(session);
    });
}

void OkxWsClient::interrupt_(Session& session) {
    session.heartbeat.cancel();
    session.status.cancel();
    beast::get_lowest_layer(session.ws).cancel();
}

void OkxWsClient::cleanup_(Session& session) {
    // Best effort: unsubscribe, then a normal close, bounded by kCleanupTimeout.
    const auto unsubscribe = handler_.unsubscribeMessage();
    auto& ws = session.ws;
    session.ioc.restart();
    if (ws.is_open()) {
        ws.async_write(net::buffer(unsubscribe), [&ws](const beast::error_code& ec, std::size_t) {
            if (ec) {
                return;
            }
            ws.async_close(websocket::close_code::normal, [](const beast::error_code&) {});
        });
        session.ioc.run_for(kCleanupTimeout);
    }

    beast::error_code ignored;
    beast::get_lowest_layer(ws).socket().shutdown(net::ip::tcp::socket::shutdown_both, ignored);
    beast::get_lowest_layer(ws).socket().close(ignored);
    session.ioc.restart();
    session.ioc.poll();
    LOG_INFO("OKX stream connection cleaned up");
}

}  // namespace adapters::okx
