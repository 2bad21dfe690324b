#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <stop_token>
#include <string>
#include <type_traits>
#include <spdlog/spdlog.h>
#include <sieve/core/concurrency.h>
#include <sieve/core/metrics.h>
#include <sieve/core/types.h>

namespace sieve::resilience {

struct RetryPolicy {
    size_t maxAttempts = 3;
    std::chrono::milliseconds initialWait{1000};
    std::chrono::milliseconds maxWait{10'000};
    double multiplier = 2.0;
    double jitterMin = 0.8;
    double jitterMax = 1.2;
    std::set<ErrorCode> retryableErrors{ErrorCode::NetworkError, ErrorCode::Timeout,
                                        ErrorCode::IOError, ErrorCode::Unavailable};

    bool isRetryable(ErrorCode code) const {
        if (code == ErrorCode::CircuitOpen || code == ErrorCode::OperationCancelled)
            return false;
        return retryableErrors.count(code) > 0;
    }

    Result<void> validate() const;
};

/**
 * @brief Retries a Result-returning callable with exponential backoff and jitter.
 *
 * The wait before attempt n+1 is min(initialWait * multiplier^(n-1) * jitter, maxWait).
 * Waits go through the injected SleepFn, which must honour the stop token and return false
 * when interrupted.
 *
 * With @p lastStart set, no retry is scheduled to begin after that instant; the last error is
 * returned instead, with its original code, so a caller running against a deadline gets the
 * dependency's failure rather than a cancellation.
 */
class RetryExecutor {
public:
    using SleepFn = std::function<bool(std::chrono::milliseconds, std::stop_token)>;

    struct Stats {
        uint64_t totalAttempts = 0;
        uint64_t totalRetries = 0;
        uint64_t totalSuccesses = 0;
        uint64_t totalFailures = 0;
    };

    explicit RetryExecutor(std::shared_ptr<IMetricsSink> metrics = nullptr, SleepFn sleep = {},
                           uint64_t seed = std::random_device{}());

    template <typename F>
    auto execute(F&& fn, const RetryPolicy& policy, std::stop_token stop = {},
                 std::optional<SteadyClock::time_point> lastStart = std::nullopt)
        -> std::invoke_result_t<F&> {
        using R = std::invoke_result_t<F&>;
        const size_t maxAttempts = std::max<size_t>(1, policy.maxAttempts);

        for (size_t attempt = 1;; ++attempt) {
            if (stop.stop_requested()) {
                totalFailures_.fetch_add(1, std::memory_order_relaxed);
                return R(Error{ErrorCode::OperationCancelled, "cancelled before attempt " +
                                                                  std::to_string(attempt)});
            }

            totalAttempts_.fetch_add(1, std::memory_order_relaxed);
            R result = fn();
            if (result) {
                totalSuccesses_.fetch_add(1, std::memory_order_relaxed);
                return result;
            }

            const Error& err = result.error();
            if (!policy.isRetryable(err.code)) {
                totalFailures_.fetch_add(1, std::memory_order_relaxed);
                return result;
            }
            if (attempt >= maxAttempts) {
                totalFailures_.fetch_add(1, std::memory_order_relaxed);
                return R(Error{err.code,
                               err.message + " (after " + std::to_string(attempt) + " attempts)"});
            }

            auto wait = backoffFor(attempt, policy);
            if (lastStart && SteadyClock::now() + wait > *lastStart) {
                totalFailures_.fetch_add(1, std::memory_order_relaxed);
                return R(Error{err.code, err.message + " (after " + std::to_string(attempt) +
                                             " attempts, no time left to retry)"});
            }
            spdlog::debug("Attempt {}/{} failed: {}; retrying in {}ms", attempt, maxAttempts,
                          err.message, wait.count());
            totalRetries_.fetch_add(1, std::memory_order_relaxed);
            if (metrics_) {
                metrics_->incrementCounter(metric_names::kRetriesTotal, {});
            }
            if (!sleep_(wait, stop)) {
                totalFailures_.fetch_add(1, std::memory_order_relaxed);
                return R(Error{ErrorCode::OperationCancelled,
                               "cancelled while waiting to retry: " + err.message});
            }
        }
    }

    /// Wait before attempt @p attempt + 1, jitter included.
    std::chrono::milliseconds backoffFor(size_t attempt, const RetryPolicy& policy);

    Stats stats() const;
    void resetStats();

private:
    std::shared_ptr<IMetricsSink> metrics_;
    SleepFn sleep_;

    std::mutex rngMutex_;
    std::mt19937_64 rng_;

    std::atomic<uint64_t> totalAttempts_{0};
    std::atomic<uint64_t> totalRetries_{0};
    std::atomic<uint64_t> totalSuccesses_{0};
    std::atomic<uint64_t> totalFailures_{0};
};

} // namespace sieve::resilience
