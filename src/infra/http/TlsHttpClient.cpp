#include "infra/http/TlsHttpClient.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/rfc2818_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>

#include "common/Log.hpp"

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr int kMaxRedirects = 5;
constexpr const char* kUserAgent = "CandleSync/1.0";

std::runtime_error makeError(const std::string& host, const std::string& target, const std::string& message) {
    std::ostringstream oss;
    oss << "GET https://" << host << target << " failed: " << message;
    return std::runtime_error(oss.str());
}

struct Location {
    std::string host;
    std::string target;
};

Location resolveRedirect(const std::string& location, const std::string& currentHost) {
    if (location.empty()) {
        throw std::runtime_error("redirect without Location header");
    }
    if (location.rfind("http://", 0) == 0) {
        throw std::runtime_error("refusing redirect to plain HTTP");
    }

    Location next{currentHost, location};
    if (location.rfind("https://", 0) == 0) {
        const std::string rest = location.substr(8);
        const auto slash = rest.find('/');
        next.host = rest.substr(0, slash);
        next.target = slash == std::string::npos ? "/" : rest.substr(slash);
        if (const auto colon = next.host.find(':'); colon != std::string::npos) {
            if (next.host.substr(colon + 1) != "443") {
                throw std::runtime_error("redirect to unsupported port " + next.host.substr(colon + 1));
            }
            next.host.erase(colon);
        }
        if (next.host.empty()) {
            throw std::runtime_error("redirect URL without host");
        }
    } else if (next.target.front() != '/') {
        next.target.insert(next.target.begin(), '/');
    }
    return next;
}

http::response<http::string_body> performRequest(const std::string& host,
                                                  const std::string& target,
                                                  const HttpOptions& options) {
    net::io_context ioc;
    ssl::context sslContext(ssl::context::tls_client);
    if (options.verifyPeer) {
        sslContext.set_default_verify_paths();
        sslContext.set_verify_mode(ssl::verify_peer);
    } else {
        sslContext.set_verify_mode(ssl::verify_none);
    }

    ssl::stream<beast::tcp_stream> stream(ioc, sslContext);
    if (options.verifyPeer) {
        stream.set_verify_callback(ssl::rfc2818_verification(host));
    }

    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        throw makeError(host, target, std::string{"cannot set SNI host name"} + (reason ? std::string{": "} + reason : ""));
    }

    net::ip::tcp::resolver resolver(ioc);
    beast::error_code ec;
    const auto results = resolver.resolve(host, "443", ec);
    if (ec) {
        throw makeError(host, target, "DNS resolution error: " + ec.message());
    }

    auto& lowestLayer = beast::get_lowest_layer(stream);
    lowestLayer.expires_after(options.timeout);
    lowestLayer.connect(results, ec);
    if (ec) {
        throw makeError(host, target, "connect error: " + ec.message());
    }

    lowestLayer.expires_after(options.timeout);
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw makeError(host, target, "TLS handshake error: " + ec.message());
    }

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, kUserAgent);
    req.set(http::field::accept, "application/json");
    req.set(http::field::connection, "close");
    for (const auto& [name, value] : options.headers) {
        req.set(name, value);
    }

    lowestLayer.expires_after(options.timeout);
    http::write(stream, req, ec);
    if (ec) {
        throw makeError(host, target, "write error: " + ec.message());
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    lowestLayer.expires_after(options.timeout);
    http::read(stream, buffer, response, ec);
    if (ec) {
        throw makeError(host, target, "read error: " + ec.message());
    }

    stream.shutdown(ec);
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        LOG_DEBUG("TLS shutdown host=" << host << " error=" << ec.message());
    }
    return response;
}

}  // namespace

HttpResponse https_get(const std::string& host, const std::string& target, const HttpOptions& options) {
    if (host.empty()) {
        throw std::runtime_error("HTTPS GET requires a host");
    }
    if (options.timeout.count() <= 0) {
        throw makeError(host, target, "timeout must be positive");
    }

    Location current{host, target.empty() ? std::string{"/"} : target};
    if (current.target.front() != '/') {
        current.target.insert(current.target.begin(), '/');
    }

    for (int redirects = 0; redirects <= kMaxRedirects; ++redirects) {
        auto response = performRequest(current.host, current.target, options);
        const auto status = static_cast<unsigned>(response.result_int());
        if (status == 301U || status == 302U || status == 307U || status == 308U) {
            try {
                current = resolveRedirect(std::string(response.base()[http::field::location]), current.host);
            } catch (const std::exception& redirectError) {
                throw makeError(current.host, current.target, redirectError.what());
            }
            LOG_DEBUG("HTTP redirect status=" << status << " to=" << current.host << current.target);
            continue;
        }

        HttpResponse result{};
        result.status = status;
        result.body = std::move(response.body());
        result.final_host = current.host;
        result.final_target = current.target;
        if (auto it = response.base().find(http::field::retry_after); it != response.base().end()) {
            result.retry_after_header = std::string{it->value()};
        }
        return result;
    }

    throw makeError(current.host, current.target, "too many redirects");
}

}  // namespace infra::http
