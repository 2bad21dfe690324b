#include <sieve/core/thread_pool.h>

namespace sieve {

void ThreadPool::start(size_t threads) {
    stop();
    if (threads == 0)
        return;
    {
        std::lock_guard<std::mutex> lk(m_);
        done_ = false;
    }
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this]() { run(); });
    }
}

void ThreadPool::stop() {
    {
        std::lock_guard<std::mutex> lk(m_);
        done_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_)
        if (t.joinable())
            t.join();
    workers_.clear();

    std::lock_guard<std::mutex> lk(m_);
    while (!q_.empty())
        q_.pop();
}

void ThreadPool::run() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lk(m_);
            cv_.wait(lk, [this]() { return done_ || !q_.empty(); });
            if (done_ && q_.empty())
                return;
            job = std::move(q_.front());
            q_.pop();
        }
        job();
    }
}

} // namespace sieve
