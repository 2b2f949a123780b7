#include "metrics.h"

#include <algorithm>
#include <limits>
#include <sstream>

#include <absl/strings/str_cat.h>

namespace wcopt {

namespace {

const std::vector<double>& DefaultBoundsMs() {
    static const std::vector<double> kBounds = {
        1, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000
    };
    return kBounds;
}

}  // namespace

void Counter::Add(int64_t delta) {
    if (delta > 0) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }
}

Histogram::Histogram(std::string name)
    : Histogram(std::move(name), DefaultBoundsMs()) {}

Histogram::Histogram(std::string name, std::vector<double> bounds_ms)
    : name_(std::move(name)), bounds_(std::move(bounds_ms)) {
    std::sort(bounds_.begin(), bounds_.end());
    counts_.assign(bounds_.size() + 1, 0);
}

void Histogram::Observe(double value_ms) {
    auto it = std::lower_bound(bounds_.begin(), bounds_.end(), value_ms);
    size_t index = static_cast<size_t>(std::distance(bounds_.begin(), it));

    std::lock_guard<std::mutex> lock(mutex_);
    counts_[index] += 1;
    count_ += 1;
    sum_ += value_ms;
}

int64_t Histogram::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

double Histogram::Sum() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sum_;
}

std::vector<std::pair<double, int64_t>> Histogram::Buckets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<double, int64_t>> result;
    result.reserve(counts_.size());

    int64_t cumulative = 0;
    for (size_t i = 0; i < bounds_.size(); ++i) {
        cumulative += counts_[i];
        result.emplace_back(bounds_[i], cumulative);
    }
    cumulative += counts_.back();
    result.emplace_back(std::numeric_limits<double>::infinity(), cumulative);
    return result;
}

ScopedTimer::ScopedTimer(Histogram& histogram)
    : histogram_(histogram), start_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    std::chrono::duration<double, std::milli> elapsed =
        std::chrono::steady_clock::now() - start_;
    histogram_.Observe(elapsed.count());
}

Counter& MetricsRegistry::GetCounter(std::string_view name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    if (it == counters_.end()) {
        std::string key(name);
        it = counters_.emplace(key, std::make_unique<Counter>(key)).first;
    }
    return *it->second;
}

Histogram& MetricsRegistry::GetHistogram(std::string_view name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histograms_.find(name);
    if (it == histograms_.end()) {
        std::string key(name);
        it = histograms_.emplace(key, std::make_unique<Histogram>(key)).first;
    }
    return *it->second;
}

int64_t MetricsRegistry::CounterValue(std::string_view name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second->Value();
}

std::string MetricsRegistry::ExportText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    for (const auto& [name, counter] : counters_) {
        oss << name << " " << counter->Value() << "\n";
    }

    for (const auto& [name, histogram] : histograms_) {
        oss << name << "_count " << histogram->Count() << "\n";
        oss << name << "_sum_ms " << histogram->Sum() << "\n";
        for (const auto& [bound, count] : histogram->Buckets()) {
            oss << name << "_bucket{le=\"" << bound << "\"} " << count << "\n";
        }
    }

    return oss.str();
}

void MetricsRegistry::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    histograms_.clear();
}

std::string LabeledName(std::string_view name, std::string_view label,
                        std::string_view value) {
    return absl::StrCat(absl::string_view(name.data(), name.size()), "{", absl::string_view(label.data(), label.size()), "=\"",
                        absl::string_view(value.data(), value.size()), "\"}");
}

}  // namespace wcopt
