#pragma once

#include "core/error.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <condition_variable>
#include <exception>
#include <format>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>

namespace dbsync {

/**
 * @brief Bounded exponential backoff shared by the connection manager and
 * the downloader
 *
 * attempt n (1-based) that fails waits
 *     min(initial_backoff * multiplier^(n-1), max_backoff)
 * before attempt n+1. No wait follows the last attempt.
 */
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{200};
    double multiplier = 2.0;
    std::chrono::milliseconds max_backoff{5000};

    // Decides whether a caught exception is worth another attempt
    std::function<bool(const std::exception&)> retryable = [](const std::exception&) { return true; };

    [[nodiscard]] std::chrono::milliseconds backoff_for(int attempt) const;

    /**
     * @brief Sleep for d, returning early (false) when stop is requested
     */
    static bool interruptible_sleep(std::chrono::milliseconds d, std::stop_token st);

    /**
     * @brief Run fn until it returns, a non-retryable exception escapes, or
     * attempts are exhausted (the last exception is rethrown)
     *
     * A stop request during a backoff throws CancelledError.
     */
    template<typename Fn>
    auto execute(Fn&& fn, std::stop_token st = {}, const std::string& what = "operation") const
        -> decltype(fn()) {
        for (int attempt = 1;; ++attempt) {
            try {
                return fn();
            } catch (const CancelledError&) {
                throw;
            } catch (const std::exception& e) {
                if (attempt >= max_attempts || !retryable(e)) throw;
                const auto delay = backoff_for(attempt);
                utils::log::warn(std::format("{} failed (attempt {}/{}), retrying in {}ms: {}",
                    what, attempt, max_attempts, delay.count(), e.what()));
                if (!interruptible_sleep(delay, st)) {
                    throw CancelledError(std::format("{} cancelled during backoff", what));
                }
            }
        }
    }
};

} // namespace dbsync
