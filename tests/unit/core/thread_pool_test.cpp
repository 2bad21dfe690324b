#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <vector>
#include <gtest/gtest.h>
#include <sieve/core/thread_pool.h>

using namespace sieve;
using namespace std::chrono_literals;

TEST(ThreadPoolTest, RunsSubmittedTasks) {
    ThreadPool pool(2);
    EXPECT_EQ(pool.size(), 2u);

    auto a = pool.submit([] { return 21 * 2; });
    auto b = pool.submit([] { return std::string("done"); });

    EXPECT_EQ(a.get(), 42);
    EXPECT_EQ(b.get(), "done");
}

TEST(ThreadPoolTest, ExceptionSurfacesOnFuture) {
    ThreadPool pool(1);
    auto fut = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(fut.get(), std::runtime_error);

    // The worker survives the throwing task.
    auto next = pool.submit([] { return 7; });
    EXPECT_EQ(next.get(), 7);
}

TEST(ThreadPoolTest, StopDrainsQueuedTasks) {
    std::atomic<int> ran{0};
    std::vector<std::future<void>> futures;
    {
        ThreadPool pool(1);
        for (int i = 0; i < 20; ++i) {
            futures.push_back(pool.submit([&ran] {
                std::this_thread::sleep_for(1ms);
                ran.fetch_add(1);
            }));
        }
    }
    EXPECT_EQ(ran.load(), 20);
    for (auto& f : futures) {
        EXPECT_EQ(f.wait_for(0ms), std::future_status::ready);
    }
}

TEST(ThreadPoolTest, TasksRunConcurrently) {
    ThreadPool pool(4);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 4; ++i) {
        futures.push_back(pool.submit([&] {
            int now = active.fetch_add(1) + 1;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {
            }
            std::this_thread::sleep_for(50ms);
            active.fetch_sub(1);
        }));
    }
    for (auto& f : futures)
        f.get();
    EXPECT_GT(peak.load(), 1);
}
