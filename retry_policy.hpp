#ifndef RETRY_POLICY_HPP
#define RETRY_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>

/**
 * @struct RetryPolicy
 * @brief How often a probe is repeated and how long to wait between tries.
 *
 * The wait before try n (n >= 1) is backoff_ms * 2^(n-1), capped at
 * MAX_DELAY_MS.
 */
struct RetryPolicy {
    static constexpr int MAX_DELAY_MS = 60000;

    int max_tries = 1;
    int backoff_ms = 0;

    int delayBeforeTry(int attempt) const {
        if (attempt <= 0 || backoff_ms <= 0) return 0;
        int64_t delay = static_cast<int64_t>(backoff_ms) << std::min(attempt - 1, 10);
        return static_cast<int>(std::min<int64_t>(delay, MAX_DELAY_MS));
    }
};

/**
 * @brief Runs @p attempt until it yields a value or the policy is exhausted.
 *
 * @p attempt is called with the zero-based try index and must return a
 * std::optional. An engaged optional ends the loop.
 */
template<typename Attempt>
auto retryWithBackoff(const RetryPolicy& policy, Attempt&& attempt)
    -> std::invoke_result_t<Attempt&, int> {
    int tries = policy.max_tries < 1 ? 1 : policy.max_tries;
    for (int i = 0; i < tries; ++i) {
        int delay = policy.delayBeforeTry(i);
        if (delay > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
        auto result = attempt(i);
        if (result) return result;
    }
    return std::nullopt;
}

#endif // RETRY_POLICY_HPP
