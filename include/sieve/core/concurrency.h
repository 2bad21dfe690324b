#pragma once

#include <chrono>
#include <stop_token>

/**
 * @file concurrency.h
 *
 * Locking rule shared by every component in sieve:
 *
 * Each shared component (LruCache, SemanticCache, CircuitBreaker, HybridQueryEngine health)
 * owns exactly one mutex and never holds it while calling into another component, a backend,
 * a logger or a metrics sink. When a method needs a consistent view of more than a few fields
 * it copies them under the lock (a snapshot) and releases the lock before doing any work on the
 * copy. Locks are therefore never nested and cannot deadlock across components.
 */

namespace sieve {

using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Sleep for @p duration unless @p token is stopped first.
 * @return false if the wait was interrupted.
 */
bool interruptibleSleep(std::chrono::milliseconds duration, std::stop_token token);

/**
 * @brief Time left until @p deadline, clamped at zero.
 */
inline std::chrono::milliseconds remainingUntil(SteadyClock::time_point deadline) {
    auto now = SteadyClock::now();
    if (now >= deadline)
        return std::chrono::milliseconds{0};
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
}

} // namespace sieve
