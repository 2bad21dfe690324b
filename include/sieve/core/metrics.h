#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace sieve {

using MetricLabels = std::map<std::string, std::string>;

namespace metric_names {
inline constexpr const char* kQueryDurationMs = "sieve_query_duration_ms";
inline constexpr const char* kVectorBackendDurationMs = "sieve_vector_backend_duration_ms";
inline constexpr const char* kRerankDurationMs = "sieve_rerank_duration_ms";
inline constexpr const char* kCacheHitsTotal = "sieve_cache_hits_total";
inline constexpr const char* kCacheMissesTotal = "sieve_cache_misses_total";
inline constexpr const char* kCircuitBreakerState = "sieve_circuit_breaker_state";
inline constexpr const char* kCircuitBreakerRejectedTotal = "sieve_circuit_breaker_rejected_total";
inline constexpr const char* kRetriesTotal = "sieve_retries_total";
} // namespace metric_names

/**
 * @brief Destination for engine metrics. Implementations must be thread-safe.
 *
 * Components call the sink without holding any of their own locks.
 */
class IMetricsSink {
public:
    virtual ~IMetricsSink() = default;

    virtual void incrementCounter(const std::string& name, const MetricLabels& labels,
                                  uint64_t delta = 1) = 0;
    virtual void observeHistogram(const std::string& name, const MetricLabels& labels,
                                  double value) = 0;
    virtual void setGauge(const std::string& name, const MetricLabels& labels, double value) = 0;
};

class NullMetricsSink final : public IMetricsSink {
public:
    void incrementCounter(const std::string&, const MetricLabels&, uint64_t) override {}
    void observeHistogram(const std::string&, const MetricLabels&, double) override {}
    void setGauge(const std::string&, const MetricLabels&, double) override {}
};

/**
 * @brief Keeps every metric in memory; used by tests and the health endpoint of embedders.
 */
class InMemoryMetricsSink final : public IMetricsSink {
public:
    void incrementCounter(const std::string& name, const MetricLabels& labels,
                          uint64_t delta = 1) override;
    void observeHistogram(const std::string& name, const MetricLabels& labels,
                          double value) override;
    void setGauge(const std::string& name, const MetricLabels& labels, double value) override;

    uint64_t counter(const std::string& name, const MetricLabels& labels = {}) const;
    std::vector<double> histogram(const std::string& name, const MetricLabels& labels = {}) const;
    double gauge(const std::string& name, const MetricLabels& labels = {}) const;

    void reset();

private:
    static std::string seriesKey(const std::string& name, const MetricLabels& labels);

    mutable std::mutex mutex_;
    std::map<std::string, uint64_t> counters_;
    std::map<std::string, std::vector<double>> histograms_;
    std::map<std::string, double> gauges_;
};

} // namespace sieve
