#include <sieve/core/concurrency.h>

#include <condition_variable>
#include <mutex>

namespace sieve {

bool interruptibleSleep(std::chrono::milliseconds duration, std::stop_token token) {
    if (duration.count() <= 0)
        return !token.stop_requested();
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lk(m);
    // Nothing notifies cv; only the timeout or a stop request ends the wait.
    cv.wait_for(lk, token, duration, [] { return false; });
    return !token.stop_requested();
}

} // namespace sieve
