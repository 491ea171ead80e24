#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "common/Metrics.hpp"
#include "core/CandleCodec.hpp"
#include "TestSupport.hpp"

namespace {

namespace codec = core::codec;

int testRawEntries() {
    const auto candle = testsupport::makeCandle(1704067200, 42000.5, 12.25);
    const auto encoded = codec::encodeRaw(candle);
    EXPECT_TRUE(encoded.rfind("[1,", 0) == 0, "raw entries lead with the schema version: " << encoded);

    const auto decoded = codec::decodeRaw(encoded);
    EXPECT_TRUE(decoded.has_value(), "current raw entry should decode");
    EXPECT_TRUE(decoded->timestamp == candle.timestamp && decoded->close == candle.close,
                "raw entry fields should survive");

    const auto legacy = codec::decodeRaw("1704067200,1.5,2.5,1.0,2.0,300");
    EXPECT_TRUE(legacy.has_value(), "pre-schema CSV rows should still decode");
    EXPECT_TRUE(legacy->timestamp == 1704067200 && legacy->volume == 300.0, "legacy fields misread");

    auto& metrics = csync::common::metrics::Registry::instance();
    const auto rejectedBefore = metrics.counter("codec_rejected_total");
    EXPECT_TRUE(!codec::decodeRaw("[2,1704067200,1,1,1,1,1]").has_value(), "future raw version should be rejected");
    EXPECT_TRUE(!codec::decodeRaw("[1,1704067200,1]").has_value(), "short row should be rejected");
    EXPECT_TRUE(metrics.counter("codec_rejected_total") == rejectedBefore + 2, "rejections should be counted");

    const auto list = codec::decodeRawList({encoded, "garbage", "1704067260,1,1,1,1,1"});
    EXPECT_TRUE(list.size() == 2, "undecodable list entries should be dropped, got " << list.size());
    return 0;
}

int testIndicatorEntries() {
    domain::IndicatorCandle row{};
    row.candle = testsupport::makeCandle(1704067200, 100.0);
    row.indicators.rsi14 = 55.5;
    row.indicators.trendState = -1;
    row.indicators.autoTrendState = 2;
    row.humanTime = "2024-01-01 00:00:00";
    row.humanTimeKr = "2024-01-01 09:00:00";

    const auto decoded = codec::decodeIndicator(codec::encodeIndicator(row));
    EXPECT_TRUE(decoded.has_value(), "indicator entry should decode");
    EXPECT_TRUE(decoded->indicators.rsi14 && std::fabs(*decoded->indicators.rsi14 - 55.5) < 1e-9, "rsi14 lost");
    EXPECT_TRUE(!decoded->indicators.atr14.has_value(), "missing indicators should stay null");
    EXPECT_TRUE(decoded->indicators.trendState == -1, "trend_state lost");
    EXPECT_TRUE(decoded->indicators.autoTrendState == 2, "auto_trend_state lost");
    EXPECT_TRUE(decoded->humanTimeKr == row.humanTimeKr, "display time lost");
    EXPECT_TRUE(decoded->updateTime.empty(), "update time is only written for current candles");

    const std::string unversioned =
        R"({"timestamp":1704067200,"open":1,"high":2,"low":0.5,"close":1.5,"volume":10,"rsi14":null})";
    const auto legacy = codec::decodeIndicator(unversioned);
    EXPECT_TRUE(legacy.has_value() && legacy->candle.close == 1.5, "unversioned objects should decode");

    EXPECT_TRUE(!codec::decodeIndicator(R"({"v":9,"timestamp":1})").has_value(), "future version rejected");
    EXPECT_TRUE(!codec::decodeIndicator(R"({"v":1,"open":1})").has_value(), "missing timestamp rejected");
    return 0;
}

int testGapMarkers() {
    const std::vector<domain::Gap> gaps{{1704067200, 1704070800}, {1704153600, 1704153600}};
    const auto decoded = codec::decodeGaps(codec::encodeGaps(gaps));
    EXPECT_TRUE(decoded == gaps, "gap markers should survive encoding");
    EXPECT_TRUE(codec::decodeGaps("not json").empty(), "bad gap payload decodes to nothing");
    return 0;
}

}  // namespace

int main() {
    int failures = 0;
    failures += testRawEntries();
    failures += testIndicatorEntries();
    failures += testGapMarkers();
    if (failures != 0) {
        std::cerr << failures << " codec test(s) failed\n";
        return 1;
    }
    return 0;
}
