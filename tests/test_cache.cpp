#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "adapters/memory/InMemoryCache.hpp"
#include "adapters/redis/RespProtocol.hpp"
#include "domain/Errors.hpp"
#include "TestSupport.hpp"

namespace {

using adapters::redis::RespValue;

int testCommandFraming() {
    const auto framed = adapters::redis::encodeCommand({"SET", "k", "v1", "NX"});
    EXPECT_TRUE(framed == "*4\r\n$3\r\nSET\r\n$1\r\nk\r\n$2\r\nv1\r\n$2\r\nNX\r\n", "unexpected framing: " << framed);
    return 0;
}

int testReplyParsing() {
    std::size_t consumed = 0;
    auto ok = adapters::redis::parseReply("+OK\r\n", consumed);
    EXPECT_TRUE(ok && ok->isOk() && consumed == 5, "simple string reply");

    auto err = adapters::redis::parseReply("-ERR wrong type\r\n", consumed);
    EXPECT_TRUE(err && err->isError() && err->text == "ERR wrong type", "error reply");

    auto nil = adapters::redis::parseReply("$-1\r\n", consumed);
    EXPECT_TRUE(nil && nil->isNull(), "null bulk string");

    const std::string scanReply = "*2\r\n$1\r\n0\r\n*2\r\n$4\r\nkey1\r\n$4\r\nkey2\r\n:7\r\n";
    auto array = adapters::redis::parseReply(scanReply, consumed);
    EXPECT_TRUE(array && array->type == RespValue::Type::Array && array->elements.size() == 2, "nested array");
    EXPECT_TRUE(array->elements[1].elements[1].text == "key2", "nested bulk element");
    EXPECT_TRUE(consumed == scanReply.size() - 4, "trailing reply must not be consumed");

    EXPECT_TRUE(!adapters::redis::parseReply("$5\r\nhel", consumed).has_value(), "partial bulk waits for more");
    EXPECT_TRUE(!adapters::redis::parseReply("*2\r\n:1\r\n", consumed).has_value(), "partial array waits");

    bool threw = false;
    try {
        adapters::redis::parseReply("?bogus\r\n", consumed);
    } catch (const domain::CacheError&) {
        threw = true;
    }
    EXPECT_TRUE(threw, "unknown type byte is a protocol error");
    return 0;
}

int testMemoryLists() {
    adapters::memory::InMemoryCache cache;
    cache.listReplace("candles:X:1m", {"a", "b", "c", "d"});
    EXPECT_TRUE(cache.listRange("candles:X:1m", 0, -1).size() == 4, "full range");
    EXPECT_TRUE(cache.listRange("candles:X:1m", -2, -1) == std::vector<std::string>({"c", "d"}), "negative range");
    EXPECT_TRUE(cache.listRange("candles:X:1m", 1, 10) == std::vector<std::string>({"b", "c", "d"}),
                "stop past the end is clamped");
    cache.listReplace("candles:X:1m", {"c", "d", "e"});
    EXPECT_TRUE(cache.listRange("candles:X:1m", 0, -1) == std::vector<std::string>({"c", "d", "e"}),
                "replace swaps the whole list");
    cache.listReplace("candles:X:1m", {});
    EXPECT_TRUE(cache.listRange("candles:X:1m", 0, -1).empty(), "empty replace clears the list");
    return 0;
}

int testMemoryKeys() {
    auto now = std::chrono::steady_clock::time_point{} + std::chrono::hours(1);
    adapters::memory::InMemoryCache cache([&now] { return now; });
    cache.set("latest:BTC-USDT-SWAP:1m", "x");
    cache.set("latest:ETH-USDT-SWAP:1m", "y", std::chrono::milliseconds(1000));
    cache.setMany({{"gaps:BTC-USDT-SWAP:1m", "[]"}, {"websocket_status", "connected"}});

    const auto latest = cache.scan("latest:*");
    EXPECT_TRUE(latest.size() == 2 && latest.front() == "latest:BTC-USDT-SWAP:1m", "scan should sort matches");
    now += std::chrono::seconds(2);
    EXPECT_TRUE(!cache.get("latest:ETH-USDT-SWAP:1m").has_value(), "expired key should vanish");
    EXPECT_TRUE(cache.scan("latest:*").size() == 1, "expired keys are not scanned");

    EXPECT_TRUE(cache.setIfAbsent("lock:a", "t1", std::chrono::milliseconds(500)), "first NX set wins");
    EXPECT_TRUE(!cache.setIfAbsent("lock:a", "t2", std::chrono::milliseconds(500)), "second NX set loses");
    EXPECT_TRUE(!cache.deleteIfEquals("lock:a", "t2"), "compare-and-delete checks the value");
    EXPECT_TRUE(cache.deleteIfEquals("lock:a", "t1"), "compare-and-delete removes on match");
    EXPECT_TRUE(cache.del("websocket_status") && !cache.del("websocket_status"), "del reports presence");

    EXPECT_TRUE(adapters::memory::InMemoryCache::globMatch("candles:*:1?", "candles:BTC:1h"), "glob ? and *");
    EXPECT_TRUE(!adapters::memory::InMemoryCache::globMatch("candles:*", "latest:BTC"), "glob prefix mismatch");
    return 0;
}

}  // namespace

int main() {
    int failures = 0;
    failures += testCommandFraming();
    failures += testReplyParsing();
    failures += testMemoryLists();
    failures += testMemoryKeys();
    if (failures != 0) {
        std::cerr << failures << " cache test(s) failed\n";
        return 1;
    }
    return 0;
}
