#include "adapters/okx/OkxStreamHandler.hpp"

#include <stdexcept>

#include <boost/json.hpp>

#include "adapters/okx/OkxBarMap.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/CacheKeys.hpp"
#include "core/CandleCodec.hpp"
#include "domain/Errors.hpp"
#include "domain/Timeframe.hpp"

namespace adapters::okx {

namespace {

namespace json = boost::json;

std::string field_string(const json::value& value) {
    if (value.is_string()) {
        return std::string{value.as_string().c_str()};
    }
    if (value.is_int64()) {
        return std::to_string(value.as_int64());
    }
    if (value.is_double()) {
        return std::to_string(value.as_double());
    }
    throw std::runtime_error("unexpected field type");
}

}  // namespace

OkxStreamHandler::OkxStreamHandler(domain::ICacheStore& cache,
                                   std::vector<std::string> symbols,
                                   std::vector<int> timeframes,
                                   std::chrono::seconds saveInterval,
                                   csync::common::EpochClock clock)
    : cache_(cache),
      symbols_(std::move(symbols)),
      timeframes_(std::move(timeframes)),
      saveInterval_(saveInterval),
      clock_(std::move(clock)) {
    if (symbols_.empty() || timeframes_.empty()) {
        throw std::invalid_argument("OkxStreamHandler requires symbols and timeframes");
    }
    for (int minutes : timeframes_) {
        // Rejects timeframes OKX cannot stream.
        static_cast<void>(okx_channel(minutes));
    }
    for (const auto& symbol : symbols_) {
        for (int minutes : timeframes_) {
            counts_[{symbol, okx_channel(minutes)}] = 0;
        }
    }
}

std::string OkxStreamHandler::argsMessage_(std::string_view op) const {
    json::array args;
    args.reserve(channelCount());
    for (const auto& symbol : symbols_) {
        for (int minutes : timeframes_) {
            json::object arg;
            arg["channel"] = okx_channel(minutes);
            arg["instId"] = symbol;
            args.emplace_back(std::move(arg));
        }
    }
    json::object message;
    message["op"] = op;
    message["args"] = std::move(args);
    return json::serialize(message);
}

std::string OkxStreamHandler::subscribeMessage() const {
    return argsMessage_("subscribe");
}

std::string OkxStreamHandler::unsubscribeMessage() const {
    return argsMessage_("unsubscribe");
}

bool OkxStreamHandler::handleMessage(std::string_view payload) {
    if (payload == "pong") {
        return false;
    }

    json::error_code ec;
    auto value = json::parse(payload, ec);
    if (ec || !value.is_object()) {
        LOG_WARN("OKX stream frame is not a JSON object bytes=" << payload.size());
        return false;
    }
    const auto& root = value.as_object();

    if (const auto* event = root.if_contains("event"); event != nullptr && event->is_string()) {
        const std::string name{event->as_string().c_str()};
        if (name == "error") {
            std::string code;
            std::string msg;
            if (const auto* c = root.if_contains("code")) {
                code = field_string(*c);
            }
            if (const auto* m = root.if_contains("msg"); m != nullptr && m->is_string()) {
                msg = std::string{m->as_string().c_str()};
            }
            LOG_ERR("OKX stream error code=" << code << " msg=" << msg);
        } else {
            LOG_DEBUG("OKX stream event=" << name);
        }
        return false;
    }

    const auto* arg = root.if_contains("arg");
    const auto* data = root.if_contains("data");
    if (arg == nullptr || !arg->is_object() || data == nullptr || !data->is_array() || data->as_array().empty()) {
        LOG_DEBUG("OKX stream frame without candle data");
        return false;
    }

    const auto* channelField = arg->as_object().if_contains("channel");
    const auto* instField = arg->as_object().if_contains("instId");
    if (channelField == nullptr || !channelField->is_string() || instField == nullptr || !instField->is_string()) {
        LOG_WARN("OKX stream frame missing channel or instId");
        return false;
    }
    const std::string channel{channelField->as_string().c_str()};
    const std::string symbol{instField->as_string().c_str()};

    int minutes = 0;
    try {
        minutes = from_okx_channel(channel);
    } catch (const std::invalid_argument&) {
        LOG_DEBUG("OKX stream ignoring channel=" << channel);
        return false;
    }

    const auto& row = data->as_array().front();
    domain::Candle candle{};
    try {
        if (!row.is_array() || row.as_array().size() < 6) {
            throw std::runtime_error("candle row shorter than 6 fields");
        }
        const auto& fields = row.as_array();
        candle.timestamp = domain::timeframe::align(std::stoll(field_string(fields.at(0))), minutes);
        candle.open = std::stod(field_string(fields.at(1)));
        candle.high = std::stod(field_string(fields.at(2)));
        candle.low = std::stod(field_string(fields.at(3)));
        candle.close = std::stod(field_string(fields.at(4)));
        candle.volume = std::stod(field_string(fields.at(5)));
        candle.isCurrent = fields.size() < 9 || field_string(fields.at(8)) != "1";
    } catch (const std::exception& ex) {
        const std::string code = domain::timeframe::toCode(minutes);
        LOG_WARN("OKX stream candle skipped " << (csync::log::UnitTag{symbol, code}) << " error=" << ex.what());
        return false;
    }

    csync::common::metrics::Registry::instance().incrementCounter("ws_messages_total");
    const auto now = clock_();
    bool flush = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[{symbol, channel}];
        pending_[{symbol, minutes}] = candle;
        const auto it = lastSave_.find(symbol);
        flush = it == lastSave_.end() || now - it->second >= saveInterval_.count();
    }
    if (flush) {
        flushLatest_(symbol, now);
    }
    return true;
}

void OkxStreamHandler::flushLatest_(const std::string& symbol, std::int64_t now) {
    std::vector<std::pair<std::string, std::string>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (int minutes : timeframes_) {
            const auto it = pending_.find({symbol, minutes});
            if (it == pending_.end()) {
                continue;
            }
            domain::IndicatorCandle latest{};
            latest.candle = it->second;
            latest.humanTime = csync::common::formatUtc(it->second.timestamp);
            latest.humanTimeKr = csync::common::formatSeoul(it->second.timestamp);
            latest.updateTime = csync::common::formatUtc(now);
            latest.updateTimeKr = csync::common::formatSeoul(now);
            entries.emplace_back(core::keys::latest(symbol, minutes), core::codec::encodeIndicator(latest));
            pending_.erase(it);
        }
        lastSave_[symbol] = now;
    }

    try {
        cache_.setMany(entries);
        LOG_DEBUG("OKX stream saved latest symbol=" << symbol << " slots=" << entries.size());
    } catch (const domain::CacheError& ex) {
        LOG_WARN("OKX stream latest write failed symbol=" << symbol << " error=" << ex.what());
    }
}

void OkxStreamHandler::reportStatus() {
    std::map<ChannelKey, std::uint64_t> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = counts_;
        for (auto& [key, count] : counts_) {
            count = 0;
        }
    }
    LOG_INFO("=== OKX subscription status ===");
    for (const auto& [key, count] : snapshot) {
        LOG_INFO(key.first << " " << key.second << ": " << count << " messages since last report");
    }
}

void OkxStreamHandler::setConnectionStatus(bool connected) {
    csync::common::metrics::Registry::instance().setGauge("ws_state", connected ? 1.0 : 0.0);
    try {
        cache_.set(std::string{core::keys::kWebsocketStatus}, connected ? "connected" : "disconnected");
    } catch (const domain::CacheError& ex) {
        LOG_WARN("websocket_status write failed: " << ex.what());
    }
}

std::map<OkxStreamHandler::ChannelKey, std::uint64_t> OkxStreamHandler::counts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counts_;
}

}  // namespace adapters::okx
