#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "domain/Candle.hpp"

namespace core::codec {

// Schema versions written into every cache entry. Version 0 is the
// pre-schema layout ("ts,o,h,l,c,v" strings and unversioned objects),
// still readable but never written.
inline constexpr int kRawVersion = 1;
inline constexpr int kIndicatorVersion = 1;

// [1, ts, open, high, low, close, volume]
std::string encodeRaw(const domain::Candle& candle);
std::optional<domain::Candle> decodeRaw(std::string_view payload);

std::string encodeIndicator(const domain::IndicatorCandle& candle);
std::optional<domain::IndicatorCandle> decodeIndicator(std::string_view payload);

std::string encodeGaps(const std::vector<domain::Gap>& gaps);
std::vector<domain::Gap> decodeGaps(std::string_view payload);

// Decodes a whole list, dropping entries that fail to decode.
std::vector<domain::Candle> decodeRawList(const std::vector<std::string>& entries);
std::vector<domain::IndicatorCandle> decodeIndicatorList(const std::vector<std::string>& entries);

}  // namespace core::codec
