#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <boost/json/value.hpp>

#include "common/TimeUtils.hpp"
#include "domain/exchange/IExchangeCandles.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::okx {

struct OkxRestOptions {
    std::string host = "www.okx.com";
    std::size_t recentPageMax = 300;
    std::size_t historyPageMax = 100;
    int maxRetries = 5;
    std::chrono::milliseconds pageDelay{500};
};

// Public market-data endpoints of OKX. Pages arrive newest first; the
// client walks backward with `after=` and returns ascending, deduplicated
// candles.
class OkxRestClient : public domain::IExchangeCandles {
public:
    using HttpGetter = std::function<infra::http::HttpResponse(const std::string& host, const std::string& target)>;

    explicit OkxRestClient(OkxRestOptions options = {},
                           HttpGetter http = {},
                           csync::common::Sleeper sleeper = csync::common::threadSleeper(),
                           csync::common::EpochClock clock = csync::common::systemEpochClock());
    ~OkxRestClient() override = default;

    std::vector<domain::Candle> fetch_candles(const std::string& symbol,
                                              int minutes,
                                              std::size_t limit,
                                              std::optional<std::int64_t> since_ms = std::nullopt) override;

    std::vector<domain::Candle> fetch_candles_before(const std::string& symbol,
                                                     int minutes,
                                                     std::size_t limit,
                                                     std::int64_t before_sec) override;

    // Rows of one response, aligned, with malformed rows dropped.
    static std::vector<domain::Candle> parse_rows(const boost::json::value& data, int minutes, std::int64_t now_sec);

private:
    struct PageWindow {
        std::optional<std::int64_t> after_ms;
        std::optional<std::int64_t> before_ms;
        bool recent_first = true;
    };

    std::vector<domain::Candle> paginate_(const std::string& symbol,
                                          int minutes,
                                          std::size_t limit,
                                          PageWindow window);
    boost::json::value get_data_(const std::string& target);

    OkxRestOptions options_;
    HttpGetter http_;
    csync::common::Sleeper sleeper_;
    csync::common::EpochClock clock_;
};

}  // namespace adapters::okx
