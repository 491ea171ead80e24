#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace adapters::redis {

// One RESP2 reply.
struct RespValue {
    enum class Type {
        SimpleString,
        Error,
        Integer,
        BulkString,
        Array,
        Null,
    };

    Type type{Type::Null};
    std::string text;
    std::int64_t integer{0};
    std::vector<RespValue> elements;

    bool isNull() const noexcept { return type == Type::Null; }
    bool isError() const noexcept { return type == Type::Error; }
    bool isOk() const noexcept { return type == Type::SimpleString && text == "OK"; }
};

// Array-of-bulk-strings request framing.
std::string encodeCommand(const std::vector<std::string>& args);

// Parses the reply starting at buffer[0]. Returns nullopt while the reply
// is incomplete; sets consumed to its length otherwise. Throws
// domain::CacheError on a protocol violation.
std::optional<RespValue> parseReply(std::string_view buffer, std::size_t& consumed);

}  // namespace adapters::redis
