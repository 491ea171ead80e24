#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/ports/IIndicatorEngine.hpp"
#include "domain/Candle.hpp"
#include "domain/Ports.hpp"
#include "domain/exchange/IExchangeCandles.hpp"

namespace core {

struct SeriesOptions {
    std::size_t maxLen = 3000;
    std::size_t gapBackfillCap = 1000;
};

// Canonical per-(symbol, timeframe) series kept in the cache: the raw
// OHLCV list, the indicator list and the in-progress candle slots. Every
// write is last-write-wins by timestamp; the durable sink mirrors the
// indicator rows and never blocks a cache write.
class CandleSeriesStore {
public:
    CandleSeriesStore(domain::ICacheStore& cache,
                      domain::IExchangeCandles& exchange,
                      const core::ports::IIndicatorEngine& engine,
                      domain::ICandleSink& sink,
                      SeriesOptions options = {});

    domain::CandleSeries loadRaw(const std::string& symbol, int minutes) const;
    domain::IndicatorSeries loadIndicators(const std::string& symbol, int minutes) const;

    // Overwrites by timestamp and persists the newest maxLen candles. The
    // returned window keeps up to maxLen + warmUp candles for indicator
    // math. In-progress and unaligned candles are not merged.
    domain::CandleSeries merge(const std::string& symbol,
                               int minutes,
                               const domain::CandleSeries& incoming,
                               std::size_t warmUp = 0);

    // merge() followed by computeIndicators() over the merged window.
    bool ingest(const std::string& symbol,
                int minutes,
                const domain::CandleSeries& incoming,
                std::size_t warmUp = 0);

    // Recomputes the indicator series from window. Tops the window up with
    // older history once when it is short. Rows at or after sinkFromTs
    // replace stored rows; older stored rows are kept. Every row written is
    // handed to the durable sink. Returns false when indicators were skipped.
    bool computeIndicators(const std::string& symbol,
                           int minutes,
                           domain::CandleSeries window,
                           std::size_t warmUp,
                           std::int64_t sinkFromTs = 0);

    // Refreshes current_candle/latest and their *_with_indicators slots.
    bool updateCurrentCandle(const std::string& symbol, int minutes, std::int64_t nowSec);

    // Backfills the hole between the stored tail and newestTs when it
    // exceeds 1.5 intervals, ingesting the fetched candles. Holes larger
    // than the cap are filled next to newestTs and the older remainder is
    // recorded as an unresolved gap. Returns the number of candles fetched.
    std::size_t detectAndFillGap(const std::string& symbol, int minutes, std::int64_t newestTs);

    std::vector<domain::Gap> unresolvedGaps(const std::string& symbol, int minutes) const;

    // Rewrites auto_trend_state of the stored indicator series from the
    // coarser timeframe's raw series.
    void recomputeAutoTrend(const std::string& symbol, int minutes);

    static std::vector<domain::Gap> internalGaps(const domain::CandleSeries& series, int minutes);

    const SeriesOptions& options() const noexcept { return options_; }

private:
    // Returns the rows that were written and survived the trim.
    domain::IndicatorSeries persistIndicators_(const std::string& symbol,
                                               int minutes,
                                               const domain::IndicatorSeries& fresh,
                                               std::int64_t replaceFromTs);
    void recordGap_(const std::string& symbol, int minutes, const domain::Gap& gap);
    void pruneGaps_(const std::string& symbol, int minutes, const domain::CandleSeries& series);
    void sinkRows_(const std::string& symbol, int minutes, const domain::IndicatorSeries& rows);

    domain::ICacheStore& cache_;
    domain::IExchangeCandles& exchange_;
    const core::ports::IIndicatorEngine& engine_;
    domain::ICandleSink& sink_;
    SeriesOptions options_;
};

}  // namespace core
