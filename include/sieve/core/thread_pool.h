#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace sieve {

/**
 * @brief Fixed-size worker pool used for concurrent backend calls.
 *
 * Tasks are wrapped in packaged_task, so exceptions thrown by a task surface on its future.
 * stop() lets workers drain tasks already queued before joining.
 */
class ThreadPool {
public:
    ThreadPool() = default;
    explicit ThreadPool(size_t threads) { start(threads); }
    ~ThreadPool() { stop(); }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void start(size_t threads);
    void stop();

    size_t size() const { return workers_.size(); }

    template <typename F, typename R = std::invoke_result_t<F&>> std::future<R> submit(F&& f) {
        // shared_ptr keeps the move-only packaged_task inside a copyable std::function
        auto pt = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        auto fut = pt->get_future();
        {
            std::lock_guard<std::mutex> lk(m_);
            q_.emplace([pt]() mutable { (*pt)(); });
        }
        cv_.notify_one();
        return fut;
    }

private:
    void run();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> q_;
    std::mutex m_;
    std::condition_variable cv_;
    bool done_{true};
};

} // namespace sieve
