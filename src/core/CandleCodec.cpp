#include "core/CandleCodec.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

#include <boost/json.hpp>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace core::codec {
namespace {

namespace json = boost::json;

double json_to_double(const json::value& value) {
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
        return std::stod(std::string{value.as_string().c_str()});
    }
    throw std::runtime_error("Unsupported JSON type for floating conversion");
}

std::int64_t json_to_int64(const json::value& value) {
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

json::value optional_value(const std::optional<double>& value) {
    if (value && std::isfinite(*value)) {
        return json::value(*value);
    }
    return json::value(nullptr);
}

json::value optional_value(const std::optional<int>& value) {
    if (value) {
        return json::value(static_cast<std::int64_t>(*value));
    }
    return json::value(nullptr);
}

std::optional<double> read_optional_double(const json::object& obj, std::string_view key) {
    const auto* field = obj.if_contains(key);
    if (field == nullptr || field->is_null()) {
        return std::nullopt;
    }
    return json_to_double(*field);
}

std::optional<int> read_optional_int(const json::object& obj, std::string_view key) {
    const auto* field = obj.if_contains(key);
    if (field == nullptr || field->is_null()) {
        return std::nullopt;
    }
    return static_cast<int>(json_to_int64(*field));
}

std::string read_string(const json::object& obj, std::string_view key) {
    const auto* field = obj.if_contains(key);
    if (field == nullptr || !field->is_string()) {
        return {};
    }
    return std::string{field->as_string().c_str()};
}

void reject(std::string_view kind, std::string_view payload, const std::string& reason) {
    csync::common::metrics::Registry::instance().incrementCounter("codec_rejected_total");
    LOG_WARN("Skipping undecodable " << kind << " entry (" << reason << "): "
                                     << payload.substr(0, 120));
}

std::optional<domain::Candle> decodeLegacyCsv(std::string_view payload) {
    std::vector<double> fields;
    std::stringstream ss{std::string{payload}};
    std::string item;
    while (std::getline(ss, item, ',')) {
        fields.push_back(std::stod(item));
    }
    if (fields.size() < 6) {
        throw std::runtime_error("legacy row has " + std::to_string(fields.size()) + " fields");
    }
    domain::Candle candle{};
    candle.timestamp = static_cast<std::int64_t>(std::llround(fields[0]));
    candle.open = fields[1];
    candle.high = fields[2];
    candle.low = fields[3];
    candle.close = fields[4];
    candle.volume = fields[5];
    return candle;
}

}  // namespace

std::string encodeRaw(const domain::Candle& candle) {
    json::array row;
    row.reserve(7);
    row.emplace_back(kRawVersion);
    row.emplace_back(candle.timestamp);
    row.emplace_back(candle.open);
    row.emplace_back(candle.high);
    row.emplace_back(candle.low);
    row.emplace_back(candle.close);
    row.emplace_back(candle.volume);
    return json::serialize(row);
}

std::optional<domain::Candle> decodeRaw(std::string_view payload) {
    if (payload.empty()) {
        return std::nullopt;
    }
    try {
        if (payload.front() != '[') {
            return decodeLegacyCsv(payload);
        }

        json::error_code ec;
        auto value = json::parse(payload, ec);
        if (ec || !value.is_array()) {
            reject("raw", payload, ec ? ec.message() : std::string{"not an array"});
            return std::nullopt;
        }
        const auto& row = value.as_array();
        if (row.empty()) {
            reject("raw", payload, "empty row");
            return std::nullopt;
        }
        const auto version = json_to_int64(row.at(0));
        if (version != kRawVersion) {
            reject("raw", payload, "unsupported version " + std::to_string(version));
            return std::nullopt;
        }
        if (row.size() < 7) {
            reject("raw", payload, "short row");
            return std::nullopt;
        }

        domain::Candle candle{};
        candle.timestamp = json_to_int64(row.at(1));
        candle.open = json_to_double(row.at(2));
        candle.high = json_to_double(row.at(3));
        candle.low = json_to_double(row.at(4));
        candle.close = json_to_double(row.at(5));
        candle.volume = json_to_double(row.at(6));
        return candle;
    } catch (const std::exception& ex) {
        reject("raw", payload, ex.what());
        return std::nullopt;
    }
}

std::string encodeIndicator(const domain::IndicatorCandle& candle) {
    json::object obj;
    obj["v"] = kIndicatorVersion;
    obj["timestamp"] = candle.candle.timestamp;
    obj["open"] = candle.candle.open;
    obj["high"] = candle.candle.high;
    obj["low"] = candle.candle.low;
    obj["close"] = candle.candle.close;
    obj["volume"] = candle.candle.volume;
    if (candle.candle.isCurrent) {
        obj["is_current"] = true;
    }
    obj["rsi14"] = optional_value(candle.indicators.rsi14);
    obj["atr14"] = optional_value(candle.indicators.atr14);
    obj["ema7"] = optional_value(candle.indicators.ema7);
    obj["sma20"] = optional_value(candle.indicators.sma20);
    obj["sma200"] = optional_value(candle.indicators.sma200);
    obj["trend_state"] = optional_value(candle.indicators.trendState);
    obj["auto_trend_state"] = optional_value(candle.indicators.autoTrendState);
    obj["human_time"] = candle.humanTime;
    obj["human_time_kr"] = candle.humanTimeKr;
    if (!candle.updateTime.empty()) {
        obj["update_time"] = candle.updateTime;
        obj["update_time_kr"] = candle.updateTimeKr;
    }
    return json::serialize(obj);
}

std::optional<domain::IndicatorCandle> decodeIndicator(std::string_view payload) {
    json::error_code ec;
    auto value = json::parse(payload, ec);
    if (ec || !value.is_object()) {
        reject("indicator", payload, ec ? ec.message() : std::string{"not an object"});
        return std::nullopt;
    }

    try {
        const auto& obj = value.as_object();
        // Objects written before versioning carry no "v" and share the v1 field names.
        std::int64_t version = 0;
        if (const auto* versionField = obj.if_contains("v")) {
            version = json_to_int64(*versionField);
        }
        if (version > kIndicatorVersion || version < 0) {
            reject("indicator", payload, "unsupported version " + std::to_string(version));
            return std::nullopt;
        }

        domain::IndicatorCandle candle{};
        candle.candle.timestamp = json_to_int64(obj.at("timestamp"));
        candle.candle.open = json_to_double(obj.at("open"));
        candle.candle.high = json_to_double(obj.at("high"));
        candle.candle.low = json_to_double(obj.at("low"));
        candle.candle.close = json_to_double(obj.at("close"));
        candle.candle.volume = json_to_double(obj.at("volume"));
        if (const auto* current = obj.if_contains("is_current"); current != nullptr && current->is_bool()) {
            candle.candle.isCurrent = current->as_bool();
        }
        candle.indicators.rsi14 = read_optional_double(obj, "rsi14");
        candle.indicators.atr14 = read_optional_double(obj, "atr14");
        candle.indicators.ema7 = read_optional_double(obj, "ema7");
        candle.indicators.sma20 = read_optional_double(obj, "sma20");
        candle.indicators.sma200 = read_optional_double(obj, "sma200");
        candle.indicators.trendState = read_optional_int(obj, "trend_state");
        candle.indicators.autoTrendState = read_optional_int(obj, "auto_trend_state");
        candle.humanTime = read_string(obj, "human_time");
        candle.humanTimeKr = read_string(obj, "human_time_kr");
        candle.updateTime = read_string(obj, "update_time");
        candle.updateTimeKr = read_string(obj, "update_time_kr");
        return candle;
    } catch (const std::exception& ex) {
        reject("indicator", payload, ex.what());
        return std::nullopt;
    }
}

std::string encodeGaps(const std::vector<domain::Gap>& gaps) {
    json::array list;
    list.reserve(gaps.size());
    for (const auto& gap : gaps) {
        json::object entry;
        entry["start_ts"] = gap.startTs;
        entry["end_ts"] = gap.endTs;
        list.emplace_back(std::move(entry));
    }
    return json::serialize(list);
}

std::vector<domain::Gap> decodeGaps(std::string_view payload) {
    std::vector<domain::Gap> gaps;
    json::error_code ec;
    auto value = json::parse(payload, ec);
    if (ec || !value.is_array()) {
        reject("gap", payload, ec ? ec.message() : std::string{"not an array"});
        return gaps;
    }
    for (const auto& item : value.as_array()) {
        if (!item.is_object()) {
            continue;
        }
        const auto& obj = item.as_object();
        const auto* start = obj.if_contains("start_ts");
        const auto* end = obj.if_contains("end_ts");
        if (start == nullptr || end == nullptr) {
            continue;
        }
        try {
            gaps.push_back(domain::Gap{json_to_int64(*start), json_to_int64(*end)});
        } catch (const std::exception& ex) {
            reject("gap", payload, ex.what());
        }
    }
    return gaps;
}

std::vector<domain::Candle> decodeRawList(const std::vector<std::string>& entries) {
    std::vector<domain::Candle> candles;
    candles.reserve(entries.size());
    for (const auto& entry : entries) {
        if (auto candle = decodeRaw(entry)) {
            candles.push_back(*candle);
        }
    }
    return candles;
}

std::vector<domain::IndicatorCandle> decodeIndicatorList(const std::vector<std::string>& entries) {
    std::vector<domain::IndicatorCandle> candles;
    candles.reserve(entries.size());
    for (const auto& entry : entries) {
        if (auto candle = decodeIndicator(entry)) {
            candles.push_back(std::move(*candle));
        }
    }
    return candles;
}

}  // namespace core::codec
