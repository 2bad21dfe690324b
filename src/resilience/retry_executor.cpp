#include <sieve/resilience/retry_executor.h>

#include <sieve/core/concurrency.h>

namespace sieve::resilience {

Result<void> RetryPolicy::validate() const {
    if (maxAttempts == 0)
        return Error{ErrorCode::InvalidArgument, "retry.max_attempts must be at least 1"};
    if (multiplier < 1.0)
        return Error{ErrorCode::InvalidArgument, "retry.multiplier must be >= 1.0"};
    if (initialWait.count() < 0 || maxWait < initialWait)
        return Error{ErrorCode::InvalidArgument, "retry.max_wait must be >= retry.initial_wait"};
    if (jitterMin <= 0.0 || jitterMax < jitterMin)
        return Error{ErrorCode::InvalidArgument, "retry jitter range is invalid"};
    return Result<void>();
}

RetryExecutor::RetryExecutor(std::shared_ptr<IMetricsSink> metrics, SleepFn sleep, uint64_t seed)
    : metrics_(std::move(metrics)), sleep_(sleep ? std::move(sleep) : SleepFn(interruptibleSleep)),
      rng_(seed) {}

std::chrono::milliseconds RetryExecutor::backoffFor(size_t attempt, const RetryPolicy& policy) {
    double jitter = 1.0;
    if (policy.jitterMax > policy.jitterMin) {
        std::uniform_real_distribution<double> dist(policy.jitterMin, policy.jitterMax);
        std::lock_guard<std::mutex> lock(rngMutex_);
        jitter = dist(rng_);
    } else {
        jitter = policy.jitterMin;
    }

    double base = static_cast<double>(policy.initialWait.count()) *
                  std::pow(policy.multiplier, static_cast<double>(attempt - 1));
    double waitMs = std::min(base * jitter, static_cast<double>(policy.maxWait.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(std::max(0.0, waitMs)));
}

RetryExecutor::Stats RetryExecutor::stats() const {
    Stats s;
    s.totalAttempts = totalAttempts_.load(std::memory_order_relaxed);
    s.totalRetries = totalRetries_.load(std::memory_order_relaxed);
    s.totalSuccesses = totalSuccesses_.load(std::memory_order_relaxed);
    s.totalFailures = totalFailures_.load(std::memory_order_relaxed);
    return s;
}

void RetryExecutor::resetStats() {
    totalAttempts_.store(0);
    totalRetries_.store(0);
    totalSuccesses_.store(0);
    totalFailures_.store(0);
}

} // namespace sieve::resilience
