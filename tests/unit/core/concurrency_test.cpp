#include <chrono>
#include <thread>
#include <gtest/gtest.h>
#include <sieve/core/concurrency.h>

using namespace sieve;
using namespace std::chrono_literals;

TEST(InterruptibleSleepTest, CompletesWhenNotStopped) {
    std::stop_source source;
    auto start = SteadyClock::now();
    EXPECT_TRUE(interruptibleSleep(20ms, source.get_token()));
    EXPECT_GE(SteadyClock::now() - start, 20ms);
}

TEST(InterruptibleSleepTest, StopRequestEndsWaitEarly) {
    std::stop_source source;
    std::thread stopper([&source] {
        std::this_thread::sleep_for(20ms);
        source.request_stop();
    });
    auto start = SteadyClock::now();
    EXPECT_FALSE(interruptibleSleep(10s, source.get_token()));
    EXPECT_LT(SteadyClock::now() - start, 5s);
    stopper.join();
}

TEST(InterruptibleSleepTest, AlreadyStoppedReturnsImmediately) {
    std::stop_source source;
    source.request_stop();
    EXPECT_FALSE(interruptibleSleep(10s, source.get_token()));
    EXPECT_FALSE(interruptibleSleep(0ms, source.get_token()));
}

TEST(RemainingUntilTest, ClampsAtZero) {
    EXPECT_EQ(remainingUntil(SteadyClock::now() - 1s).count(), 0);
    auto left = remainingUntil(SteadyClock::now() + 10s);
    EXPECT_GT(left, 9s);
    EXPECT_LE(left, 10s);
}
