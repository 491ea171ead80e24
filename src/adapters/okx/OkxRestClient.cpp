#include "adapters/okx/OkxRestClient.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/json.hpp>

#include "adapters/okx/OkxBarMap.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"
#include "domain/Timeframe.hpp"

namespace {

std::int64_t json_to_int64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        return std::stoll(std::string{value.as_string().c_str()});
    }
    throw std::runtime_error("Unsupported JSON type for integer conversion");
}

double json_to_double(const boost::json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    if (value.is_string()) {
        const double parsed = std::stod(std::string{value.as_string().c_str()});
        if (!std::isfinite(parsed)) {
            throw std::runtime_error("non-finite value");
        }
        return parsed;
    }
    throw std::runtime_error("Unsupported JSON type for floating conversion");
}

}  // namespace

namespace adapters::okx {

namespace {
constexpr const char* kRecentPath = "/api/v5/market/candles";
constexpr const char* kHistoryPath = "/api/v5/market/history-candles";
constexpr const char* kRateLimitCode = "50011";
}  // namespace

OkxRestClient::OkxRestClient(OkxRestOptions options,
                             HttpGetter http,
                             csync::common::Sleeper sleeper,
                             csync::common::EpochClock clock)
    : options_(std::move(options)),
      http_(std::move(http)),
      sleeper_(std::move(sleeper)),
      clock_(std::move(clock)) {
    if (!http_) {
        http_ = [](const std::string& host, const std::string& target) {
            return infra::http::https_get(host, target);
        };
    }
    if (options_.recentPageMax == 0 || options_.historyPageMax == 0) {
        throw std::invalid_argument("OKX page sizes must be positive");
    }
}

std::vector<domain::Candle> OkxRestClient::fetch_candles(const std::string& symbol,
                                                         int minutes,
                                                         std::size_t limit,
                                                         std::optional<std::int64_t> since_ms) {
    if (!since_ms) {
        return paginate_(symbol, minutes, limit, PageWindow{});
    }

    // `before` is exclusive, so step one millisecond back to include since_ms.
    const std::int64_t spanMs = static_cast<std::int64_t>(limit) * domain::timeframe::intervalSeconds(minutes) * 1000;
    PageWindow window;
    window.after_ms = *since_ms + spanMs;
    window.before_ms = *since_ms - 1;
    auto candles = paginate_(symbol, minutes, limit, window);
    if (candles.size() > limit) {
        candles.resize(limit);
    }
    return candles;
}

std::vector<domain::Candle> OkxRestClient::fetch_candles_before(const std::string& symbol,
                                                                int minutes,
                                                                std::size_t limit,
                                                                std::int64_t before_sec) {
    PageWindow window;
    window.after_ms = before_sec * 1000;
    window.recent_first = false;
    return paginate_(symbol, minutes, limit, window);
}

std::vector<domain::Candle> OkxRestClient::paginate_(const std::string& symbol,
                                                     int minutes,
                                                     std::size_t limit,
                                                     PageWindow window) {
    if (symbol.empty() || limit == 0) {
        return {};
    }

    const std::string bar = okx_bar(minutes);
    const std::string code = domain::timeframe::toCode(minutes);
    const csync::log::UnitTag unit{symbol, code};
    std::map<std::int64_t, domain::Candle> collected;
    std::optional<std::int64_t> cursor = window.after_ms;
    bool firstPage = true;

    while (collected.size() < limit) {
        if (!firstPage) {
            sleeper_(options_.pageDelay);
        }

        const bool useRecent = firstPage && window.recent_first;
        const std::size_t pageMax = useRecent ? options_.recentPageMax : options_.historyPageMax;
        const std::size_t request = std::min(limit - collected.size(), pageMax);

        std::ostringstream target;
        target << (useRecent ? kRecentPath : kHistoryPath) << "?instId=" << symbol << "&bar=" << bar
               << "&limit=" << request;
        if (cursor) {
            target << "&after=" << *cursor;
        }
        if (window.before_ms) {
            target << "&before=" << *window.before_ms;
        }

        const auto data = get_data_(target.str());
        const auto page = parse_rows(data, minutes, clock_());

        std::size_t added = 0;
        for (const auto& candle : page) {
            if (window.before_ms && candle.timestamp * 1000 <= *window.before_ms) {
                continue;
            }
            if (collected.emplace(candle.timestamp, candle).second) {
                ++added;
            }
        }
        LOG_DEBUG("OKX page " << unit << " rows=" << page.size() << " added=" << added
                              << " total=" << collected.size());
        firstPage = false;

        // The recent endpoint only serves the latest bars; older windows
        // come back empty there and are retried on history.
        if (added == 0 && useRecent) {
            LOG_DEBUG("OKX recent page empty, retrying on history " << unit);
            continue;
        }
        if (added == 0 || collected.empty()) {
            break;
        }
        cursor = collected.begin()->first * 1000;
        if (window.before_ms && *cursor <= *window.before_ms + 1) {
            break;
        }
    }

    std::vector<domain::Candle> candles;
    candles.reserve(collected.size());
    for (auto& [ts, candle] : collected) {
        candles.push_back(candle);
    }
    if (!window.before_ms && candles.size() > limit) {
        candles.erase(candles.begin(), candles.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return candles;
}

boost::json::value OkxRestClient::get_data_(const std::string& target) {
    auto& metrics = csync::common::metrics::Registry::instance();
    for (int attempt = 0; attempt < options_.maxRetries; ++attempt) {
        infra::http::HttpResponse response;
        try {
            csync::common::metrics::Registry::ScopedTimer timer("okx_rest_latency");
            response = http_(options_.host, target);
        } catch (const std::exception& ex) {
            metrics.incrementCounter("okx_rest_errors_total");
            throw domain::ExchangeError(domain::ExchangeError::Kind::Network, ex.what());
        }

        boost::json::value json;
        boost::json::error_code ec;
        if (!response.body.empty()) {
            json = boost::json::parse(response.body, ec);
        }

        const boost::json::object* root = (!ec && json.is_object()) ? &json.as_object() : nullptr;
        std::string code;
        if (root != nullptr) {
            if (const auto* codeField = root->if_contains("code"); codeField != nullptr && codeField->is_string()) {
                code = std::string{codeField->as_string().c_str()};
            }
        }

        if (response.status == 429U || code == kRateLimitCode) {
            metrics.incrementCounter("okx_rate_limited_total");
            if (attempt + 1 >= options_.maxRetries) {
                break;
            }
            const auto backoff = std::chrono::milliseconds(1000LL << attempt);
            LOG_WARN("OKX rate limited attempt=" << (attempt + 1) << " wait_ms=" << backoff.count()
                                                 << " target=" << target);
            sleeper_(backoff);
            continue;
        }

        if (response.status != 200U) {
            metrics.incrementCounter("okx_rest_errors_total");
            throw domain::ExchangeError(domain::ExchangeError::Kind::Network,
                                        "OKX " + target + " returned HTTP " + std::to_string(response.status));
        }
        if (root == nullptr) {
            throw domain::ExchangeError(domain::ExchangeError::Kind::Malformed, "OKX " + target + " returned non-JSON body");
        }
        if (!code.empty() && code != "0") {
            std::string message;
            if (const auto* msg = root->if_contains("msg"); msg != nullptr && msg->is_string()) {
                message = std::string{msg->as_string().c_str()};
            }
            throw domain::ExchangeError(domain::ExchangeError::Kind::Malformed,
                                        "OKX " + target + " rejected code=" + code + " msg=" + message);
        }
        const auto* data = root->if_contains("data");
        if (data == nullptr || !data->is_array()) {
            throw domain::ExchangeError(domain::ExchangeError::Kind::Malformed, "OKX " + target + " missing data array");
        }
        return *data;
    }

    throw domain::ExchangeError(domain::ExchangeError::Kind::RateLimited,
                                "OKX " + target + " still rate limited after " + std::to_string(options_.maxRetries) +
                                    " attempts");
}

std::vector<domain::Candle> OkxRestClient::parse_rows(const boost::json::value& data, int minutes, std::int64_t now_sec) {
    std::vector<domain::Candle> candles;
    if (!data.is_array()) {
        return candles;
    }

    const auto intervalSec = domain::timeframe::intervalSeconds(minutes);
    candles.reserve(data.as_array().size());
    for (const auto& rowValue : data.as_array()) {
        if (!rowValue.is_array() || rowValue.as_array().size() < 6) {
            LOG_WARN("OKX row skipped: expected at least 6 fields");
            continue;
        }
        const auto& row = rowValue.as_array();
        const bool hasNull = std::any_of(row.begin(), row.begin() + 6, [](const boost::json::value& v) {
            return v.is_null();
        });
        if (hasNull) {
            LOG_WARN("OKX row skipped: null field");
            continue;
        }

        domain::Candle candle{};
        try {
            candle.timestamp = domain::timeframe::align(json_to_int64(row.at(0)), minutes);
            candle.open = json_to_double(row.at(1));
            candle.high = json_to_double(row.at(2));
            candle.low = json_to_double(row.at(3));
            candle.close = json_to_double(row.at(4));
            candle.volume = json_to_double(row.at(5));
        } catch (const std::exception& ex) {
            LOG_WARN("OKX row skipped: " << ex.what());
            continue;
        }
        candle.isCurrent = candle.timestamp + intervalSec > now_sec;

        if (candle.volume == 0.0 && !candle.isCurrent) {
            continue;
        }
        candles.push_back(candle);
    }

    std::sort(candles.begin(), candles.end(), [](const domain::Candle& a, const domain::Candle& b) {
        return a.timestamp < b.timestamp;
    });
    return candles;
}

}  // namespace adapters::okx
