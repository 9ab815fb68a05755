#include "core/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace dbsync {

std::chrono::milliseconds RetryPolicy::backoff_for(int attempt) const {
    if (attempt < 1) attempt = 1;
    const double scaled = static_cast<double>(initial_backoff.count()) *
                          std::pow(multiplier, attempt - 1);
    const double capped = std::min(scaled, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

bool RetryPolicy::interruptible_sleep(std::chrono::milliseconds d, std::stop_token st) {
    if (!st.stop_possible()) {
        std::this_thread::sleep_for(d);
        return true;
    }
    std::mutex mtx;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait_for(lock, st, d, [] { return false; });
    return !st.stop_requested();
}

} // namespace dbsync
