#include "core/CandleSeriesStore.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "common/TimeUtils.hpp"
#include "core/CacheKeys.hpp"
#include "core/CandleCodec.hpp"
#include "domain/Errors.hpp"
#include "domain/Timeframe.hpp"

namespace core {

namespace {

using csync::log::UnitTag;

void stampTimes(domain::IndicatorCandle& row) {
    row.humanTime = csync::common::formatUtc(row.candle.timestamp);
    row.humanTimeKr = csync::common::formatSeoul(row.candle.timestamp);
}

std::vector<std::string> encodeAll(const domain::CandleSeries& series) {
    std::vector<std::string> out;
    out.reserve(series.size());
    for (const auto& candle : series) {
        out.push_back(codec::encodeRaw(candle));
    }
    return out;
}

std::vector<std::string> encodeAll(const domain::IndicatorSeries& series) {
    std::vector<std::string> out;
    out.reserve(series.size());
    for (const auto& row : series) {
        out.push_back(codec::encodeIndicator(row));
    }
    return out;
}

domain::CandleSeries candlesOf(const domain::IndicatorSeries& series) {
    domain::CandleSeries out;
    out.reserve(series.size());
    for (const auto& row : series) {
        out.push_back(row.candle);
    }
    return out;
}

}  // namespace

CandleSeriesStore::CandleSeriesStore(domain::ICacheStore& cache,
                                     domain::IExchangeCandles& exchange,
                                     const core::ports::IIndicatorEngine& engine,
                                     domain::ICandleSink& sink,
                                     SeriesOptions options)
    : cache_(cache),
      exchange_(exchange),
      engine_(engine),
      sink_(sink),
      options_(options) {
    if (options_.maxLen == 0) {
        throw std::invalid_argument("CandleSeriesStore maxLen must be positive");
    }
}

domain::CandleSeries CandleSeriesStore::loadRaw(const std::string& symbol, int minutes) const {
    auto series = codec::decodeRawList(cache_.listRange(keys::raw(symbol, minutes), 0, -1));
    std::stable_sort(series.begin(), series.end(), [](const domain::Candle& a, const domain::Candle& b) {
        return a.timestamp < b.timestamp;
    });
    series.erase(std::unique(series.begin(), series.end(),
                             [](const domain::Candle& a, const domain::Candle& b) {
                                 return a.timestamp == b.timestamp;
                             }),
                 series.end());
    return series;
}

domain::IndicatorSeries CandleSeriesStore::loadIndicators(const std::string& symbol, int minutes) const {
    auto series = codec::decodeIndicatorList(cache_.listRange(keys::indicators(symbol, minutes), 0, -1));
    std::stable_sort(series.begin(), series.end(),
                     [](const domain::IndicatorCandle& a, const domain::IndicatorCandle& b) {
                         return a.candle.timestamp < b.candle.timestamp;
                     });
    return series;
}

domain::CandleSeries CandleSeriesStore::merge(const std::string& symbol,
                                              int minutes,
                                              const domain::CandleSeries& incoming,
                                              std::size_t warmUp) {
    const std::string code = domain::timeframe::toCode(minutes);
    const UnitTag unit{symbol, code};

    std::map<std::int64_t, domain::Candle> byTs;
    for (const auto& candle : loadRaw(symbol, minutes)) {
        byTs[candle.timestamp] = candle;
    }

    std::size_t accepted = 0;
    for (const auto& candle : incoming) {
        if (candle.isCurrent) {
            continue;
        }
        if (!domain::timeframe::isAligned(candle.timestamp, minutes)) {
            LOG_WARN("merge rejected unaligned candle " << unit << " ts=" << candle.timestamp);
            csync::common::metrics::Registry::instance().incrementCounter("series_unaligned_total");
            continue;
        }
        byTs[candle.timestamp] = candle;
        ++accepted;
    }

    domain::CandleSeries window;
    window.reserve(byTs.size());
    for (const auto& [ts, candle] : byTs) {
        window.push_back(candle);
    }
    const std::size_t windowCap = options_.maxLen + warmUp;
    if (window.size() > windowCap) {
        window.erase(window.begin(), window.end() - static_cast<std::ptrdiff_t>(windowCap));
    }

    const auto persistFrom = window.size() > options_.maxLen
                                 ? window.end() - static_cast<std::ptrdiff_t>(options_.maxLen)
                                 : window.begin();
    cache_.listReplace(keys::raw(symbol, minutes), encodeAll(domain::CandleSeries(persistFrom, window.end())));

    csync::common::metrics::Registry::instance().incrementCounter("series_merged_candles", accepted);
    LOG_DEBUG("merge " << unit << " incoming=" << incoming.size() << " accepted=" << accepted
                       << " window=" << window.size());
    return window;
}

bool CandleSeriesStore::ingest(const std::string& symbol,
                               int minutes,
                               const domain::CandleSeries& incoming,
                               std::size_t warmUp) {
    auto window = merge(symbol, minutes, incoming, warmUp);
    std::int64_t sinkFromTs = 0;
    if (!incoming.empty()) {
        sinkFromTs = std::min_element(incoming.begin(), incoming.end(),
                                      [](const domain::Candle& a, const domain::Candle& b) {
                                          return a.timestamp < b.timestamp;
                                      })->timestamp;
    }
    return computeIndicators(symbol, minutes, std::move(window), warmUp, sinkFromTs);
}

bool CandleSeriesStore::computeIndicators(const std::string& symbol,
                                          int minutes,
                                          domain::CandleSeries window,
                                          std::size_t warmUp,
                                          std::int64_t sinkFromTs) {
    const std::string code = domain::timeframe::toCode(minutes);
    const UnitTag unit{symbol, code};
    const std::size_t minimum = engine_.minimumCandles();

    if (window.size() < minimum && !window.empty()) {
        const auto missing = minimum - window.size();
        LOG_INFO("indicator top-up " << unit << " have=" << window.size() << " fetching=" << minimum);
        try {
            const auto older = exchange_.fetch_candles_before(symbol, minutes, minimum, window.front().timestamp);
            window = merge(symbol, minutes, older, std::max(warmUp, missing));
        } catch (const domain::ExchangeError& ex) {
            LOG_WARN("indicator top-up failed " << unit << " error=" << ex.what());
        }
    }
    if (window.size() < minimum) {
        LOG_WARN("indicators skipped " << unit << " candles=" << window.size() << " minimum=" << minimum);
        csync::common::metrics::Registry::instance().incrementCounter("indicators_skipped_total");
        return false;
    }

    const auto coarser = loadRaw(symbol, domain::timeframe::coarserTimeframe(minutes));
    domain::IndicatorSeries computed;
    try {
        csync::common::metrics::Registry::ScopedTimer timer("indicator_compute");
        computed = engine_.compute(window, coarser);
    } catch (const std::invalid_argument& ex) {
        LOG_WARN("indicators rejected " << unit << " error=" << ex.what());
        return false;
    }

    computed.erase(computed.begin(),
                   computed.begin() + static_cast<std::ptrdiff_t>(std::min(warmUp, computed.size())));
    if (computed.empty()) {
        LOG_WARN("indicators skipped " << unit << " only warm-up rows computed, warm_up=" << warmUp);
        csync::common::metrics::Registry::instance().incrementCounter("indicators_skipped_total");
        return false;
    }
    for (auto& row : computed) {
        stampTimes(row);
    }

    sinkRows_(symbol, minutes, persistIndicators_(symbol, minutes, computed, sinkFromTs));
    return true;
}

domain::IndicatorSeries CandleSeriesStore::persistIndicators_(const std::string& symbol,
                                                              int minutes,
                                                              const domain::IndicatorSeries& fresh,
                                                              std::int64_t replaceFromTs) {
    std::map<std::int64_t, domain::IndicatorCandle> byTs;
    for (auto& row : loadIndicators(symbol, minutes)) {
        byTs[row.candle.timestamp] = std::move(row);
    }

    // Rows older than replaceFromTs were computed with more history than
    // this window holds; they are only filled in where missing.
    domain::IndicatorSeries written;
    for (const auto& row : fresh) {
        if (row.candle.timestamp >= replaceFromTs) {
            byTs[row.candle.timestamp] = row;
            written.push_back(row);
        } else if (byTs.emplace(row.candle.timestamp, row).second) {
            written.push_back(row);
        }
    }

    domain::IndicatorSeries merged;
    merged.reserve(byTs.size());
    for (auto& [ts, row] : byTs) {
        merged.push_back(std::move(row));
    }
    if (merged.size() > options_.maxLen) {
        merged.erase(merged.begin(), merged.end() - static_cast<std::ptrdiff_t>(options_.maxLen));
    }
    cache_.listReplace(keys::indicators(symbol, minutes), encodeAll(merged));

    const auto oldestKept = merged.empty() ? 0 : merged.front().candle.timestamp;
    written.erase(std::remove_if(written.begin(), written.end(),
                                 [&](const domain::IndicatorCandle& row) {
                                     return row.candle.timestamp < oldestKept;
                                 }),
                  written.end());
    return written;
}

void CandleSeriesStore::sinkRows_(const std::string& symbol, int minutes, const domain::IndicatorSeries& rows) {
    if (rows.empty()) {
        return;
    }
    if (!sink_.upsert(symbol, minutes, rows)) {
        const std::string code = domain::timeframe::toCode(minutes);
        LOG_WARN("durable write failed " << (UnitTag{symbol, code}) << " rows=" << rows.size()
                                         << "; cache remains authoritative");
    }
}

bool CandleSeriesStore::updateCurrentCandle(const std::string& symbol, int minutes, std::int64_t nowSec) {
    const std::string code = domain::timeframe::toCode(minutes);
    const UnitTag unit{symbol, code};
    const auto intervalSec = domain::timeframe::intervalSeconds(minutes);

    const auto newest = exchange_.fetch_candles(symbol, minutes, 2);
    const auto it = std::find_if(newest.rbegin(), newest.rend(), [&](const domain::Candle& candle) {
        return candle.timestamp + intervalSec > nowSec;
    });
    if (it == newest.rend()) {
        LOG_DEBUG("no in-progress candle " << unit);
        return false;
    }

    domain::IndicatorCandle current{};
    current.candle = *it;
    current.candle.isCurrent = true;
    stampTimes(current);
    current.updateTime = csync::common::formatUtc(nowSec);
    current.updateTimeKr = csync::common::formatSeoul(nowSec);

    const auto plain = codec::encodeIndicator(current);
    cache_.setMany({{keys::current(symbol, minutes), plain}, {keys::latest(symbol, minutes), plain}});

    auto candles = candlesOf(loadIndicators(symbol, minutes));
    while (!candles.empty() && candles.back().timestamp >= current.candle.timestamp) {
        candles.pop_back();
    }
    candles.push_back(current.candle);
    if (candles.size() < engine_.minimumCandles()) {
        LOG_DEBUG("current candle without indicators " << unit << " history=" << candles.size());
        return true;
    }

    domain::IndicatorCandle withIndicators = current;
    try {
        const auto computed =
            engine_.compute(candles, loadRaw(symbol, domain::timeframe::coarserTimeframe(minutes)));
        withIndicators.indicators = computed.back().indicators;
    } catch (const std::invalid_argument& ex) {
        LOG_WARN("current candle indicators rejected " << unit << " error=" << ex.what());
        return true;
    }

    const auto enriched = codec::encodeIndicator(withIndicators);
    cache_.setMany({{keys::currentWithIndicators(symbol, minutes), enriched},
                    {keys::latestWithIndicators(symbol, minutes), enriched}});
    sinkRows_(symbol, minutes, {withIndicators});
    return true;
}

std::size_t CandleSeriesStore::detectAndFillGap(const std::string& symbol, int minutes, std::int64_t newestTs) {
    const std::string code = domain::timeframe::toCode(minutes);
    const UnitTag unit{symbol, code};
    const auto interval = domain::timeframe::intervalSeconds(minutes);

    const auto series = loadRaw(symbol, minutes);
    if (series.empty()) {
        return 0;
    }
    const auto lastTs = series.back().timestamp;
    // distance > 1.5 * interval
    if ((newestTs - lastTs) * 2 <= interval * 3) {
        pruneGaps_(symbol, minutes, series);
        return 0;
    }

    const auto startTs = lastTs + interval;
    const auto endTs = newestTs - interval;
    const auto missing = static_cast<std::size_t>((endTs - startTs) / interval + 1);
    const auto limit = std::min(missing, options_.gapBackfillCap);
    // Clamped fills stay contiguous with the live edge; the older part of
    // the hole is left to age out of the window.
    const auto fillFrom = endTs - (static_cast<std::int64_t>(limit) - 1) * interval;
    LOG_INFO("gap detected " << unit << " from=" << csync::common::formatUtc(startTs)
                             << " to=" << csync::common::formatUtc(endTs) << " missing=" << missing);

    const auto fetched = exchange_.fetch_candles(symbol, minutes, limit, fillFrom * 1000);
    if (!fetched.empty()) {
        ingest(symbol, minutes, fetched);
    }
    csync::common::metrics::Registry::instance().incrementCounter("gap_backfills_total");

    if (missing > limit) {
        const domain::Gap remainder{startTs, fillFrom - interval};
        LOG_WARN("gap exceeds backfill cap " << unit << " cap=" << options_.gapBackfillCap
                                             << " unresolved_from=" << csync::common::formatUtc(remainder.startTs)
                                             << " unresolved_to=" << csync::common::formatUtc(remainder.endTs));
        recordGap_(symbol, minutes, remainder);
    }
    pruneGaps_(symbol, minutes, loadRaw(symbol, minutes));
    return fetched.size();
}

std::vector<domain::Gap> CandleSeriesStore::unresolvedGaps(const std::string& symbol, int minutes) const {
    const auto payload = cache_.get(keys::gaps(symbol, minutes));
    if (!payload) {
        return {};
    }
    return codec::decodeGaps(*payload);
}

void CandleSeriesStore::recordGap_(const std::string& symbol, int minutes, const domain::Gap& gap) {
    auto gaps = unresolvedGaps(symbol, minutes);
    if (std::find(gaps.begin(), gaps.end(), gap) == gaps.end()) {
        gaps.push_back(gap);
    }
    cache_.set(keys::gaps(symbol, minutes), codec::encodeGaps(gaps));
    csync::common::metrics::Registry::instance().incrementCounter("gaps_unresolved_total");
}

void CandleSeriesStore::pruneGaps_(const std::string& symbol, int minutes, const domain::CandleSeries& series) {
    auto gaps = unresolvedGaps(symbol, minutes);
    if (gaps.empty()) {
        return;
    }

    const auto interval = domain::timeframe::intervalSeconds(minutes);
    std::set<std::int64_t> present;
    for (const auto& candle : series) {
        present.insert(candle.timestamp);
    }
    const auto oldest = series.empty() ? 0 : series.front().timestamp;

    const auto before = gaps.size();
    gaps.erase(std::remove_if(gaps.begin(), gaps.end(),
                              [&](const domain::Gap& gap) {
                                  if (gap.endTs < oldest) {
                                      return true;  // aged out of the retention window
                                  }
                                  for (auto ts = gap.startTs; ts <= gap.endTs; ts += interval) {
                                      if (present.count(ts) == 0) {
                                          return false;
                                      }
                                  }
                                  return true;
                              }),
               gaps.end());
    if (gaps.size() == before) {
        return;
    }
    if (gaps.empty()) {
        cache_.del(keys::gaps(symbol, minutes));
    } else {
        cache_.set(keys::gaps(symbol, minutes), codec::encodeGaps(gaps));
    }
    const std::string code = domain::timeframe::toCode(minutes);
    LOG_INFO("gap markers resolved " << (UnitTag{symbol, code}) << " count=" << (before - gaps.size()));
}

void CandleSeriesStore::recomputeAutoTrend(const std::string& symbol, int minutes) {
    auto series = loadIndicators(symbol, minutes);
    if (series.empty()) {
        return;
    }
    const auto coarser = loadRaw(symbol, domain::timeframe::coarserTimeframe(minutes));
    engine_.applyAutoTrend(series, coarser);
    cache_.listReplace(keys::indicators(symbol, minutes), encodeAll(series));
    sinkRows_(symbol, minutes, series);

    const std::string code = domain::timeframe::toCode(minutes);
    LOG_INFO("auto trend recomputed " << (UnitTag{symbol, code}) << " rows=" << series.size()
                                      << " coarser_rows=" << coarser.size());
}

std::vector<domain::Gap> CandleSeriesStore::internalGaps(const domain::CandleSeries& series, int minutes) {
    std::vector<domain::Gap> gaps;
    const auto interval = domain::timeframe::intervalSeconds(minutes);
    for (std::size_t i = 1; i < series.size(); ++i) {
        const auto distance = series[i].timestamp - series[i - 1].timestamp;
        if (distance * 2 >= interval * 3) {
            gaps.push_back({series[i - 1].timestamp + interval, series[i].timestamp - interval});
        }
    }
    return gaps;
}

}  // namespace core
