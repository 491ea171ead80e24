#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <utility>
#include <vector>

namespace csync::common::metrics {
namespace {

double computeQuantile(const std::vector<double>& sortedValues, double quantile) {
    if (sortedValues.empty()) {
        return 0.0;
    }
    if (sortedValues.size() == 1U) {
        return sortedValues.front();
    }

    const double clampedQuantile = std::clamp(quantile, 0.0, 1.0);
    const double position = clampedQuantile * static_cast<double>(sortedValues.size() - 1U);
    const auto lowerIndex = static_cast<std::size_t>(std::floor(position));
    const auto upperIndex = static_cast<std::size_t>(std::ceil(position));

    if (lowerIndex == upperIndex) {
        return sortedValues[lowerIndex];
    }

    const double weight = position - static_cast<double>(lowerIndex);
    return sortedValues[lowerIndex]
        + weight * (sortedValues[upperIndex] - sortedValues[lowerIndex]);
}

}  // namespace

Registry::Registry()
    : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

Registry::ScopedTimer::ScopedTimer(std::string timerKey)
    : impl_(std::make_unique<ScopedTimerImpl>(Registry::instance(), std::move(timerKey))) {}

Registry::ScopedTimer::~ScopedTimer() = default;

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

void Registry::setGauge(const std::string& gaugeKey, double value) {
    const auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& gauge = gauges_[gaugeKey];
    gauge.value = value;
    gauge.updatedAt = now;
}

std::uint64_t Registry::counter(const std::string& counterKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = counters_.find(counterKey); it != counters_.end()) {
        return it->second;
    }
    return 0U;
}

std::optional<double> Registry::gauge(const std::string& gaugeKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = gauges_.find(gaugeKey); it != gauges_.end()) {
        return it->second.value;
    }
    return std::nullopt;
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.timers.reserve(timerMetrics_.size());
    for (const auto& [timerKey, metricsPtr] : timerMetrics_) {
        TimerSnapshot timerSnapshot;
        timerSnapshot.samples = metricsPtr->samples.load(std::memory_order_relaxed);

        const auto window = metricsPtr->copyLatencies();
        if (!window.empty()) {
            std::vector<double> latencies(window.begin(), window.end());
            std::sort(latencies.begin(), latencies.end());
            timerSnapshot.p50Ms = computeQuantile(latencies, 0.50);
            timerSnapshot.p95Ms = computeQuantile(latencies, 0.95);
            timerSnapshot.maxMs = latencies.back();
        }

        snapshot.timers.emplace(timerKey, std::move(timerSnapshot));
    }

    snapshot.counters = counters_;

    snapshot.gauges.reserve(gauges_.size());
    for (const auto& [key, gauge] : gauges_) {
        snapshot.gauges.emplace(key, GaugeSnapshot{gauge.value, gauge.updatedAt});
    }

    return snapshot;
}

void Registry::TimerMetrics::addLatency(double latencyMs) {
    samples.fetch_add(1U, std::memory_order_relaxed);
    std::lock_guard<std::mutex> lock(latenciesMutex);
    latenciesMs.push_back(latencyMs);
    if (latenciesMs.size() > kMaxLatencySamples) {
        latenciesMs.pop_front();
    }
}

std::deque<double> Registry::TimerMetrics::copyLatencies() const {
    std::lock_guard<std::mutex> lock(latenciesMutex);
    return latenciesMs;
}

Registry::TimerMetrics& Registry::ensureTimerMetrics(const std::string& timerKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = timerMetrics_.try_emplace(timerKey, nullptr);
    if (inserted) {
        it->second = std::make_unique<TimerMetrics>();
    }
    return *it->second;
}

Registry::ScopedTimerImpl::ScopedTimerImpl(Registry& registry, std::string timerKey)
    : metrics_(&registry.ensureTimerMetrics(timerKey)),
      start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimerImpl::~ScopedTimerImpl() {
    if (metrics_ == nullptr) {
        return;
    }

    const auto end = std::chrono::steady_clock::now();
    const auto duration = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(end - start_);
    metrics_->addLatency(duration.count());
}

}  // namespace csync::common::metrics
