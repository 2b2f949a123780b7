#pragma once

/// @file metrics.h
/// @brief In-process counters and latency histograms for analysis calls

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wcopt {

/// @brief Monotonic counter
class Counter {
public:
    explicit Counter(std::string name) : name_(std::move(name)) {}

    void Increment() { Add(1); }

    /// @brief Add a non-negative amount; negative deltas are ignored
    void Add(int64_t delta);

    int64_t Value() const { return value_.load(std::memory_order_relaxed); }
    const std::string& Name() const { return name_; }

private:
    std::string name_;
    std::atomic<int64_t> value_{0};
};

/// @brief Latency histogram in milliseconds with fixed upper bounds
class Histogram {
public:
    explicit Histogram(std::string name);
    Histogram(std::string name, std::vector<double> bounds_ms);

    void Observe(double value_ms);

    int64_t Count() const;
    double Sum() const;

    /// @brief Cumulative counts per upper bound, the last bound is +Inf
    std::vector<std::pair<double, int64_t>> Buckets() const;

    const std::string& Name() const { return name_; }

private:
    std::string name_;
    std::vector<double> bounds_;
    mutable std::mutex mutex_;
    std::vector<int64_t> counts_;
    int64_t count_ = 0;
    double sum_ = 0.0;
};

/// @brief Observes the elapsed wall time into a histogram on destruction
class ScopedTimer {
public:
    explicit ScopedTimer(Histogram& histogram);
    ~ScopedTimer();

    // Non-copyable
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// @brief Owns the counters and histograms of one engine instance.
///
/// Metric names may carry one label, rendered as name{label="value"}.
class MetricsRegistry {
public:
    MetricsRegistry() = default;

    // Non-copyable
    MetricsRegistry(const MetricsRegistry&) = delete;
    MetricsRegistry& operator=(const MetricsRegistry&) = delete;

    Counter& GetCounter(std::string_view name);
    Histogram& GetHistogram(std::string_view name);

    /// @brief Value of a counter, 0 when it was never created
    int64_t CounterValue(std::string_view name) const;

    /// @brief Text exposition of every metric, sorted by name
    std::string ExportText() const;

    void Reset();

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Counter>, std::less<>> counters_;
    std::map<std::string, std::unique_ptr<Histogram>, std::less<>> histograms_;
};

/// @brief Build a labeled metric name, e.g. analysis_calls{analysis="get_dead_stock"}
std::string LabeledName(std::string_view name, std::string_view label,
                        std::string_view value);

}  // namespace wcopt
