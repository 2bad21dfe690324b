#include <sieve/resilience/circuit_breaker.h>

#include <spdlog/spdlog.h>

namespace sieve::resilience {

const char* stateToString(CircuitBreaker::State state) {
    switch (state) {
        case CircuitBreaker::State::Closed: return "closed";
        case CircuitBreaker::State::Open: return "open";
        case CircuitBreaker::State::HalfOpen: return "half_open";
    }
    return "unknown";
}

CircuitBreaker::CircuitBreaker(std::string name, Config config,
                               std::shared_ptr<IMetricsSink> metrics, ClockFn clock)
    : name_(std::move(name)), config_(config), metrics_(std::move(metrics)),
      clock_(clock ? std::move(clock) : ClockFn([] { return SteadyClock::now(); })) {
    if (config_.failureThreshold == 0) {
        config_.failureThreshold = 1;
    }
    lastStateChange_ = clock_();
    if (metrics_) {
        metrics_->setGauge(metric_names::kCircuitBreakerState, {{"breaker", name_}},
                           stateGaugeValue(State::Closed));
    }
}

CircuitBreaker::Admission CircuitBreaker::acquire() {
    std::optional<Transition> transition;
    Admission admission = Admission::Rejected;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_();
        switch (state_) {
            case State::Closed:
                admission = Admission::Allowed;
                break;
            case State::Open:
                if (openedAt_ && now - *openedAt_ >= config_.recoveryTimeout) {
                    transition = transitionTo(State::HalfOpen, now);
                    probesInFlight_ = 1;
                    admission = Admission::Probe;
                }
                break;
            case State::HalfOpen:
                if (probesInFlight_ == 0) {
                    probesInFlight_ = 1;
                    admission = Admission::Probe;
                }
                break;
        }
        if (admission == Admission::Rejected) {
            ++totalRejected_;
        }
    }
    publish(transition, admission == Admission::Rejected);
    return admission;
}

void CircuitBreaker::onSuccess(Admission admission) {
    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++totalSuccesses_;
        if (admission == Admission::Probe) {
            probesInFlight_ = 0;
            if (state_ == State::HalfOpen) {
                transition = transitionTo(State::Closed, clock_());
            }
        }
        // A success admitted while Closed does not erase failures still inside the window.
    }
    publish(transition, false);
}

void CircuitBreaker::onFailure(Admission admission, ErrorCode code) {
    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (admission == Admission::Probe) {
            probesInFlight_ = 0;
        }
        if (isTransient(code)) {
            auto now = clock_();
            ++totalFailures_;
            failureTimes_.push_back(now);
            pruneWindow(now);

            if (state_ == State::HalfOpen && admission == Admission::Probe) {
                transition = transitionTo(State::Open, now);
            } else if (state_ == State::Closed &&
                       failureTimes_.size() >= config_.failureThreshold) {
                transition = transitionTo(State::Open, now);
            }
        }
    }
    publish(transition, false);
}

void CircuitBreaker::reset() {
    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failureTimes_.clear();
        probesInFlight_ = 0;
        if (state_ != State::Closed) {
            transition = transitionTo(State::Closed, clock_());
        }
        openedAt_.reset();
    }
    publish(transition, false);
}

CircuitBreaker::State CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

CircuitBreaker::Stats CircuitBreaker::stats() const {
    Stats s;
    s.name = name_;
    s.failureThreshold = config_.failureThreshold;

    std::lock_guard<std::mutex> lock(mutex_);
    auto cutoff = clock_() - config_.failureWindow;
    size_t inWindow = 0;
    for (auto t : failureTimes_) {
        if (t >= cutoff)
            ++inWindow;
    }
    s.state = state_;
    s.failureCount = inWindow;
    s.halfOpenProbesInFlight = probesInFlight_;
    s.totalSuccesses = totalSuccesses_;
    s.totalFailures = totalFailures_;
    s.totalRejected = totalRejected_;
    s.totalOpened = totalOpened_;
    s.totalClosed = totalClosed_;
    s.stateChanges = stateChanges_;
    s.openedAt = openedAt_;
    s.lastStateChange = lastStateChange_;
    return s;
}

void CircuitBreaker::pruneWindow(SteadyClock::time_point now) {
    auto cutoff = now - config_.failureWindow;
    while (!failureTimes_.empty() && failureTimes_.front() < cutoff) {
        failureTimes_.pop_front();
    }
}

std::optional<CircuitBreaker::Transition> CircuitBreaker::transitionTo(State next,
                                                                       SteadyClock::time_point now) {
    if (next == state_)
        return std::nullopt;

    Transition t{state_, next};
    state_ = next;
    lastStateChange_ = now;
    ++stateChanges_;

    switch (next) {
        case State::Open:
            openedAt_ = now;
            ++totalOpened_;
            break;
        case State::Closed:
            failureTimes_.clear();
            openedAt_.reset();
            ++totalClosed_;
            break;
        case State::HalfOpen:
            break;
    }
    return t;
}

void CircuitBreaker::publish(const std::optional<Transition>& transition, bool rejected) {
    if (transition) {
        if (transition->to == State::Open) {
            spdlog::warn("Circuit breaker '{}' opened ({} -> {})", name_,
                         stateToString(transition->from), stateToString(transition->to));
        } else if (transition->to == State::Closed) {
            spdlog::info("Circuit breaker '{}' closed", name_);
        } else {
            spdlog::info("Circuit breaker '{}' half-open, admitting probe", name_);
        }
        if (metrics_) {
            metrics_->setGauge(metric_names::kCircuitBreakerState, {{"breaker", name_}},
                               stateGaugeValue(transition->to));
        }
    }
    if (rejected) {
        spdlog::debug("Circuit breaker '{}' rejected call", name_);
        if (metrics_) {
            metrics_->incrementCounter(metric_names::kCircuitBreakerRejectedTotal,
                                       {{"breaker", name_}});
        }
    }
}

} // namespace sieve::resilience
