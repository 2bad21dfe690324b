#include <sieve/core/metrics.h>

#include <sstream>

namespace sieve {

std::string InMemoryMetricsSink::seriesKey(const std::string& name, const MetricLabels& labels) {
    std::ostringstream ss;
    ss << name << '{';
    bool first = true;
    for (const auto& [k, v] : labels) {
        if (!first)
            ss << ',';
        ss << k << '=' << v;
        first = false;
    }
    ss << '}';
    return ss.str();
}

void InMemoryMetricsSink::incrementCounter(const std::string& name, const MetricLabels& labels,
                                           uint64_t delta) {
    auto key = seriesKey(name, labels);
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[key] += delta;
}

void InMemoryMetricsSink::observeHistogram(const std::string& name, const MetricLabels& labels,
                                           double value) {
    auto key = seriesKey(name, labels);
    std::lock_guard<std::mutex> lock(mutex_);
    histograms_[key].push_back(value);
}

void InMemoryMetricsSink::setGauge(const std::string& name, const MetricLabels& labels,
                                   double value) {
    auto key = seriesKey(name, labels);
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[key] = value;
}

uint64_t InMemoryMetricsSink::counter(const std::string& name, const MetricLabels& labels) const {
    auto key = seriesKey(name, labels);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(key);
    return it == counters_.end() ? 0 : it->second;
}

std::vector<double> InMemoryMetricsSink::histogram(const std::string& name,
                                                   const MetricLabels& labels) const {
    auto key = seriesKey(name, labels);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histograms_.find(key);
    return it == histograms_.end() ? std::vector<double>{} : it->second;
}

double InMemoryMetricsSink::gauge(const std::string& name, const MetricLabels& labels) const {
    auto key = seriesKey(name, labels);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = gauges_.find(key);
    return it == gauges_.end() ? 0.0 : it->second;
}

void InMemoryMetricsSink::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    histograms_.clear();
    gauges_.clear();
}

} // namespace sieve
