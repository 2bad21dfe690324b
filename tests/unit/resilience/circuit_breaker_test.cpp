#include <chrono>
#include <memory>
#include <gtest/gtest.h>
#include <sieve/resilience/circuit_breaker.h>

#include "common/test_backends.h"

using namespace sieve;
using namespace sieve::resilience;
using namespace std::chrono_literals;

namespace {

Result<int> ok() {
    return 1;
}

Result<int> transientFailure() {
    return Error{ErrorCode::NetworkError, "connection refused"};
}

} // namespace

class CircuitBreakerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.failureThreshold = 5;
        config_.failureWindow = 60s;
        config_.recoveryTimeout = 30s;
        metrics_ = std::make_shared<InMemoryMetricsSink>();
        breaker_ = std::make_unique<CircuitBreaker>("vector-backend", config_, metrics_, clock_.fn());
    }

    void failTimes(int n) {
        for (int i = 0; i < n; ++i) {
            auto r = breaker_->call(transientFailure);
            ASSERT_FALSE(r);
        }
    }

    test::FakeClock clock_;
    CircuitBreakerConfig config_;
    std::shared_ptr<InMemoryMetricsSink> metrics_;
    std::unique_ptr<CircuitBreaker> breaker_;
};

TEST_F(CircuitBreakerTest, StartsClosed) {
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::Closed);
    auto r = breaker_->call(ok);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), 1);
    EXPECT_DOUBLE_EQ(metrics_->gauge(metric_names::kCircuitBreakerState,
                                     {{"breaker", "vector-backend"}}),
                     0.0);
}

TEST_F(CircuitBreakerTest, OpensOnFifthFailureInsideWindow) {
    failTimes(4);
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::Closed);

    failTimes(1);
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::Open);
    EXPECT_DOUBLE_EQ(metrics_->gauge(metric_names::kCircuitBreakerState,
                                     {{"breaker", "vector-backend"}}),
                     1.0);

    auto stats = breaker_->stats();
    EXPECT_EQ(stats.totalOpened, 1u);
    EXPECT_TRUE(stats.openedAt.has_value());
}

TEST_F(CircuitBreakerTest, OpenCircuitRejectsWithoutCallingDependency) {
    failTimes(5);

    int invoked = 0;
    auto r = breaker_->call([&invoked]() -> Result<int> {
        ++invoked;
        return 1;
    });
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::CircuitOpen);
    EXPECT_EQ(invoked, 0);
    EXPECT_EQ(breaker_->stats().totalRejected, 1u);
    EXPECT_EQ(metrics_->counter(metric_names::kCircuitBreakerRejectedTotal,
                                {{"breaker", "vector-backend"}}),
              1u);
}

TEST_F(CircuitBreakerTest, FailuresOutsideWindowAreForgotten) {
    failTimes(4);
    clock_.advance(61s);
    failTimes(1);
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::Closed);
    EXPECT_EQ(breaker_->stats().failureCount, 1u);
}

TEST_F(CircuitBreakerTest, NonTransientErrorsDoNotCount) {
    for (int i = 0; i < 10; ++i) {
        auto r = breaker_->call(
            []() -> Result<int> { return Error{ErrorCode::InvalidArgument, "bad input"}; });
        EXPECT_FALSE(r);
    }
    for (int i = 0; i < 10; ++i) {
        auto r = breaker_->call(
            []() -> Result<int> { return Error{ErrorCode::OperationCancelled, "cancelled"}; });
        EXPECT_FALSE(r);
    }
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::Closed);
    EXPECT_EQ(breaker_->stats().failureCount, 0u);
}

TEST_F(CircuitBreakerTest, SuccessWhileClosedKeepsFailureHistory) {
    failTimes(4);
    ASSERT_TRUE(breaker_->call(ok));
    failTimes(1);
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::Open);
}

TEST_F(CircuitBreakerTest, StaysOpenUntilRecoveryTimeout) {
    failTimes(5);
    clock_.advance(29s);
    EXPECT_EQ(breaker_->call(ok).error().code, ErrorCode::CircuitOpen);
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::Open);
}

TEST_F(CircuitBreakerTest, SuccessfulProbeCloses) {
    failTimes(5);
    clock_.advance(30s);

    auto r = breaker_->call(ok);
    ASSERT_TRUE(r);
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::Closed);

    auto stats = breaker_->stats();
    EXPECT_EQ(stats.failureCount, 0u);
    EXPECT_EQ(stats.totalClosed, 1u);
    EXPECT_FALSE(stats.openedAt.has_value());
}

TEST_F(CircuitBreakerTest, FailedProbeReopensAndRestartsTimer) {
    failTimes(5);
    clock_.advance(30s);

    EXPECT_FALSE(breaker_->call(transientFailure));
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::Open);
    EXPECT_EQ(breaker_->stats().totalOpened, 2u);

    clock_.advance(10s);
    EXPECT_EQ(breaker_->call(ok).error().code, ErrorCode::CircuitOpen);
    clock_.advance(20s);
    EXPECT_TRUE(breaker_->call(ok));
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::Closed);
}

TEST_F(CircuitBreakerTest, HalfOpenAdmitsSingleProbe) {
    failTimes(5);
    clock_.advance(30s);

    auto first = breaker_->acquire();
    EXPECT_EQ(first, CircuitBreaker::Admission::Probe);
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::HalfOpen);
    EXPECT_DOUBLE_EQ(metrics_->gauge(metric_names::kCircuitBreakerState,
                                     {{"breaker", "vector-backend"}}),
                     2.0);

    EXPECT_EQ(breaker_->acquire(), CircuitBreaker::Admission::Rejected);
    EXPECT_EQ(breaker_->stats().halfOpenProbesInFlight, 1u);

    breaker_->onSuccess(first);
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::Closed);
    EXPECT_EQ(breaker_->acquire(), CircuitBreaker::Admission::Allowed);
}

TEST_F(CircuitBreakerTest, ProbeEndingInPermanentErrorFreesSlot) {
    failTimes(5);
    clock_.advance(30s);

    auto r = breaker_->call(
        []() -> Result<int> { return Error{ErrorCode::InvalidArgument, "bad request"}; });
    EXPECT_FALSE(r);
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::HalfOpen);
    EXPECT_EQ(breaker_->acquire(), CircuitBreaker::Admission::Probe);
}

TEST_F(CircuitBreakerTest, ResetClosesAndClearsHistory) {
    failTimes(5);
    breaker_->reset();
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::Closed);
    EXPECT_EQ(breaker_->stats().failureCount, 0u);

    failTimes(4);
    EXPECT_EQ(breaker_->state(), CircuitBreaker::State::Closed);
}

TEST_F(CircuitBreakerTest, StatsTrackTotals) {
    ASSERT_TRUE(breaker_->call(ok));
    failTimes(5);
    (void)breaker_->call(ok);

    auto stats = breaker_->stats();
    EXPECT_EQ(stats.name, "vector-backend");
    EXPECT_EQ(stats.totalSuccesses, 1u);
    EXPECT_EQ(stats.totalFailures, 5u);
    EXPECT_EQ(stats.totalRejected, 1u);
    EXPECT_EQ(stats.failureThreshold, 5u);
    EXPECT_EQ(stats.stateChanges, 1u);
}

TEST(CircuitBreakerStateTest, StateNames) {
    EXPECT_STREQ(stateToString(CircuitBreaker::State::Closed), "closed");
    EXPECT_STREQ(stateToString(CircuitBreaker::State::Open), "open");
    EXPECT_STREQ(stateToString(CircuitBreaker::State::HalfOpen), "half_open");
}
