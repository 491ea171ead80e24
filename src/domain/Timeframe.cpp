#include "domain/Timeframe.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace domain::timeframe {
namespace {

constexpr std::int64_t kBarEndOffsetSec = 2;
constexpr std::int64_t kBarEndWindowSec = 3;

std::int64_t floor_div(std::int64_t value, std::int64_t divisor) {
    auto quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

}  // namespace

bool isKnown(int minutes) noexcept {
    return !detail::known_code(minutes).empty();
}

std::string toCode(int minutes) {
    if (minutes <= 0) {
        throw std::invalid_argument("Timeframe minutes must be positive: " + std::to_string(minutes));
    }
    if (const auto code = detail::known_code(minutes); !code.empty()) {
        return std::string{code};
    }
    if (minutes % 60 == 0) {
        return std::to_string(minutes / 60) + "h";
    }
    return std::to_string(minutes) + "m";
}

int toMinutes(std::string_view code) {
    if (const auto minutes = detail::known_minutes(code); minutes > 0) {
        return minutes;
    }
    if (code.size() < 2) {
        throw std::invalid_argument("Unknown timeframe code: " + std::string{code});
    }

    const char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(code.back())));
    const auto digits = code.substr(0, code.size() - 1);
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        throw std::invalid_argument("Unknown timeframe code: " + std::string{code});
    }

    const int count = std::stoi(std::string{digits});
    if (count <= 0) {
        throw std::invalid_argument("Unknown timeframe code: " + std::string{code});
    }
    switch (unit) {
    case 'm':
        return count;
    case 'h':
        return count * 60;
    case 'd':
        return count * 1440;
    default:
        throw std::invalid_argument("Unknown timeframe code: " + std::string{code});
    }
}

std::int64_t align(std::int64_t timestampMs, int minutes) {
    if (minutes <= 0) {
        throw std::invalid_argument("Timeframe minutes must be positive");
    }
    const std::int64_t bucketMs = static_cast<std::int64_t>(minutes) * 60'000;
    return floor_div(timestampMs, bucketMs) * bucketMs / 1000;
}

bool isAligned(std::int64_t timestampSec, int minutes) noexcept {
    return minutes > 0 && timestampSec % intervalSeconds(minutes) == 0;
}

std::string convert_timeframe(int minutes) {
    if (minutes < 60) {
        return std::to_string(minutes) + "m";
    }
    if (minutes == 60) {
        return "1h";
    }
    if (minutes == 240) {
        return "4h";
    }
    if (minutes == 1440) {
        return "1d";
    }
    return std::to_string(minutes / 60) + "h";
}

std::string normalize_symbol(std::string_view symbol) {
    std::string base{symbol};
    constexpr std::string_view kSwapSuffix = "-SWAP";
    if (base.size() >= kSwapSuffix.size() &&
        base.compare(base.size() - kSwapSuffix.size(), kSwapSuffix.size(), kSwapSuffix) == 0) {
        base.erase(base.size() - kSwapSuffix.size());
    }

    std::vector<std::string> parts;
    std::stringstream ss(base);
    std::string part;
    while (std::getline(ss, part, '-')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }

    std::string normalized;
    for (const auto& item : parts) {
        if (!normalized.empty()) {
            normalized.push_back('_');
        }
        normalized += item;
    }
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return normalized;
}

int coarserTimeframe(int minutes) noexcept {
    switch (minutes) {
    case 1:
        return 5;
    case 3:
        return 15;
    case 5:
        return 30;
    case 15:
        return 60;
    case 30:
    case 60:
        return 240;
    default:
        return 1440;
    }
}

std::chrono::seconds refreshInterval(int minutes) noexcept {
    if (minutes <= 1) {
        return std::chrono::seconds(2);
    }
    if (minutes <= 5) {
        return std::chrono::seconds(5);
    }
    if (minutes <= 15) {
        return std::chrono::seconds(10);
    }
    if (minutes <= 30) {
        return std::chrono::seconds(15);
    }
    if (minutes <= 60) {
        return std::chrono::seconds(20);
    }
    return std::chrono::seconds(30);
}

bool isBarEndWindow(std::int64_t nowSec, int minutes) noexcept {
    if (minutes <= 0) {
        return false;
    }
    const auto offset = nowSec % intervalSeconds(minutes);
    return offset >= kBarEndOffsetSec && offset < kBarEndOffsetSec + kBarEndWindowSec;
}

}  // namespace domain::timeframe
