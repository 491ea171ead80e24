#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace csync::common::metrics {

class Registry {
private:
    class ScopedTimerImpl;

public:
    struct TimerSnapshot {
        std::uint64_t samples{0};
        std::optional<double> p50Ms{};
        std::optional<double> p95Ms{};
        std::optional<double> maxMs{};
    };

    struct GaugeSnapshot {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::unordered_map<std::string, TimerSnapshot> timers;
        std::unordered_map<std::string, std::uint64_t> counters;
        std::unordered_map<std::string, GaugeSnapshot> gauges;
    };

    // Records the lifetime of the enclosing scope under timerKey.
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string timerKey);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;
        ScopedTimer(ScopedTimer&&) = delete;
        ScopedTimer& operator=(ScopedTimer&&) = delete;

    private:
        std::unique_ptr<ScopedTimerImpl> impl_;
    };

    static constexpr std::size_t kMaxLatencySamples = 1024;

    static Registry& instance();

    void incrementCounter(const std::string& counterKey,
                          std::uint64_t value = 1U);
    void setGauge(const std::string& gaugeKey, double value);
    std::uint64_t counter(const std::string& counterKey) const;
    std::optional<double> gauge(const std::string& gaugeKey) const;
    Snapshot snapshot() const;

private:
    struct TimerMetrics {
        std::atomic<std::uint64_t> samples{0};
        mutable std::mutex latenciesMutex;
        std::deque<double> latenciesMs;

        void addLatency(double latencyMs);
        std::deque<double> copyLatencies() const;
    };

    struct GaugeMetrics {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
    };

    class ScopedTimerImpl {
    public:
        ScopedTimerImpl(Registry& registry, std::string timerKey);
        ~ScopedTimerImpl();

    private:
        TimerMetrics* metrics_{nullptr};
        std::chrono::steady_clock::time_point start_;
    };

    Registry();

    TimerMetrics& ensureTimerMetrics(const std::string& timerKey);

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<TimerMetrics>> timerMetrics_;
    std::unordered_map<std::string, std::uint64_t> counters_;
    std::unordered_map<std::string, GaugeMetrics> gauges_;
};

}  // namespace csync::common::metrics
