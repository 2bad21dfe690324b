#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <sieve/core/concurrency.h>
#include <sieve/core/metrics.h>
#include <sieve/core/types.h>

namespace sieve::resilience {

using ClockFn = std::function<SteadyClock::time_point()>;

struct CircuitBreakerConfig {
    size_t failureThreshold = 5;
    std::chrono::milliseconds failureWindow{60'000};
    std::chrono::milliseconds recoveryTimeout{30'000};
};

/**
 * @brief Three-state circuit breaker guarding one external dependency.
 *
 * Closed: calls pass and counted failures are kept in a sliding window. Reaching
 * failureThreshold failures inside failureWindow opens the circuit.
 *
 * Open: calls are rejected with ErrorCode::CircuitOpen without touching the dependency.
 * The first call after recoveryTimeout moves the breaker to HalfOpen and becomes the probe.
 *
 * HalfOpen: exactly one probe is in flight, everything else is rejected. A successful probe
 * closes the circuit, a failed one reopens it and restarts the recovery timer.
 *
 * Only transient errors (see isTransient) count as failures. Cancellation and permanent
 * errors leave the failure window untouched.
 */
class CircuitBreaker {
public:
    enum class State { Closed, Open, HalfOpen };

    using Config = CircuitBreakerConfig;

    struct Stats {
        std::string name;
        State state = State::Closed;
        size_t failureCount = 0;
        size_t failureThreshold = 0;
        size_t halfOpenProbesInFlight = 0;
        uint64_t totalSuccesses = 0;
        uint64_t totalFailures = 0;
        uint64_t totalRejected = 0;
        uint64_t totalOpened = 0;
        uint64_t totalClosed = 0;
        uint64_t stateChanges = 0;
        std::optional<SteadyClock::time_point> openedAt;
        SteadyClock::time_point lastStateChange;
    };

    /// Outcome of asking the breaker for permission to call.
    enum class Admission { Rejected, Allowed, Probe };

    explicit CircuitBreaker(std::string name, Config config = {},
                            std::shared_ptr<IMetricsSink> metrics = nullptr, ClockFn clock = {});

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /**
     * @brief Run @p fn through the breaker. @p fn must return a sieve::Result.
     *
     * The breaker mutex is not held while @p fn runs.
     */
    template <typename F> auto call(F&& fn) -> std::invoke_result_t<F&> {
        using R = std::invoke_result_t<F&>;
        Admission admission = acquire();
        if (admission == Admission::Rejected) {
            return R(Error{ErrorCode::CircuitOpen, "circuit '" + name_ + "' is open"});
        }
        R result = fn();
        if (result) {
            onSuccess(admission);
        } else {
            onFailure(admission, result.error().code);
        }
        return result;
    }

    /// Ask for permission; a non-Rejected admission must be followed by onSuccess/onFailure.
    Admission acquire();
    void onSuccess(Admission admission);
    void onFailure(Admission admission, ErrorCode code);

    /// Force the breaker closed and drop the failure history.
    void reset();

    State state() const;
    Stats stats() const;
    const std::string& name() const { return name_; }
    const Config& config() const { return config_; }

private:
    struct Transition {
        State from;
        State to;
    };

    // Must be called with mutex_ held.
    void pruneWindow(SteadyClock::time_point now);
    std::optional<Transition> transitionTo(State next, SteadyClock::time_point now);

    // Called without mutex_ held.
    void publish(const std::optional<Transition>& transition, bool rejected);

    std::string name_;
    Config config_;
    std::shared_ptr<IMetricsSink> metrics_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    State state_ = State::Closed;
    std::deque<SteadyClock::time_point> failureTimes_;
    std::optional<SteadyClock::time_point> openedAt_;
    SteadyClock::time_point lastStateChange_;
    size_t probesInFlight_ = 0;

    uint64_t totalSuccesses_ = 0;
    uint64_t totalFailures_ = 0;
    uint64_t totalRejected_ = 0;
    uint64_t totalOpened_ = 0;
    uint64_t totalClosed_ = 0;
    uint64_t stateChanges_ = 0;
};

const char* stateToString(CircuitBreaker::State state);

/// Gauge value published as sieve_circuit_breaker_state.
constexpr double stateGaugeValue(CircuitBreaker::State state) {
    switch (state) {
        case CircuitBreaker::State::Closed: return 0.0;
        case CircuitBreaker::State::Open: return 1.0;
        case CircuitBreaker::State::HalfOpen: return 2.0;
    }
    return 0.0;
}

} // namespace sieve::resilience
