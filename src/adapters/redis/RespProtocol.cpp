#include "adapters/redis/RespProtocol.hpp"

#include <string>

#include "domain/Errors.hpp"

namespace adapters::redis {
namespace {

constexpr std::string_view kCrlf = "\r\n";

std::int64_t parse_integer(std::string_view text) {
    if (text.empty()) {
        throw domain::CacheError("RESP: empty integer");
    }
    try {
        std::size_t consumed = 0;
        const auto value = std::stoll(std::string{text}, &consumed);
        if (consumed != text.size()) {
            throw domain::CacheError("RESP: trailing bytes in integer '" + std::string{text} + "'");
        }
        return value;
    } catch (const std::logic_error&) {
        throw domain::CacheError("RESP: invalid integer '" + std::string{text} + "'");
    }
}

// Returns the line after the type byte, excluding CRLF, or nullopt when the
// terminator has not arrived yet.
std::optional<std::string_view> read_line(std::string_view buffer, std::size_t offset, std::size_t& next) {
    const auto end = buffer.find(kCrlf, offset);
    if (end == std::string_view::npos) {
        return std::nullopt;
    }
    next = end + kCrlf.size();
    return buffer.substr(offset, end - offset);
}

std::optional<RespValue> parse_at(std::string_view buffer, std::size_t offset, std::size_t& next) {
    if (offset >= buffer.size()) {
        return std::nullopt;
    }

    const char type = buffer[offset];
    std::size_t afterLine = 0;
    const auto line = read_line(buffer, offset + 1, afterLine);
    if (!line) {
        return std::nullopt;
    }

    RespValue value{};
    switch (type) {
    case '+':
        value.type = RespValue::Type::SimpleString;
        value.text = std::string{*line};
        next = afterLine;
        return value;
    case '-':
        value.type = RespValue::Type::Error;
        value.text = std::string{*line};
        next = afterLine;
        return value;
    case ':':
        value.type = RespValue::Type::Integer;
        value.integer = parse_integer(*line);
        next = afterLine;
        return value;
    case '$': {
        const auto length = parse_integer(*line);
        if (length < 0) {
            value.type = RespValue::Type::Null;
            next = afterLine;
            return value;
        }
        const auto size = static_cast<std::size_t>(length);
        if (buffer.size() < afterLine + size + kCrlf.size()) {
            return std::nullopt;
        }
        if (buffer.substr(afterLine + size, kCrlf.size()) != kCrlf) {
            throw domain::CacheError("RESP: bulk string missing terminator");
        }
        value.type = RespValue::Type::BulkString;
        value.text = std::string{buffer.substr(afterLine, size)};
        next = afterLine + size + kCrlf.size();
        return value;
    }
    case '*': {
        const auto count = parse_integer(*line);
        if (count < 0) {
            value.type = RespValue::Type::Null;
            next = afterLine;
            return value;
        }
        value.type = RespValue::Type::Array;
        value.elements.reserve(static_cast<std::size_t>(count));
        std::size_t cursor = afterLine;
        for (std::int64_t i = 0; i < count; ++i) {
            std::size_t elementEnd = 0;
            auto element = parse_at(buffer, cursor, elementEnd);
            if (!element) {
                return std::nullopt;
            }
            value.elements.push_back(std::move(*element));
            cursor = elementEnd;
        }
        next = cursor;
        return value;
    }
    default:
        throw domain::CacheError(std::string{"RESP: unexpected type byte '"} + type + "'");
    }
}

}  // namespace

std::string encodeCommand(const std::vector<std::string>& args) {
    std::string out;
    out.reserve(16 + args.size() * 16);
    out += '*';
    out += std::to_string(args.size());
    out += kCrlf;
    for (const auto& arg : args) {
        out += '$';
        out += std::to_string(arg.size());
        out += kCrlf;
        out += arg;
        out += kCrlf;
    }
    return out;
}

std::optional<RespValue> parseReply(std::string_view buffer, std::size_t& consumed) {
    std::size_t next = 0;
    auto value = parse_at(buffer, 0, next);
    if (value) {
        consumed = next;
    }
    return value;
}

}  // namespace adapters::redis
