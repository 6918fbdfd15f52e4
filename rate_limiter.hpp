#ifndef RATE_LIMITER_HPP
#define RATE_LIMITER_HPP

#include <cstddef>
#include <deque>
#include <mutex>

/**
 * @class RateLimiter
 * @brief Paces probes to roughly max_rate per second, adapting to history.
 *
 * Each delay is (1 / max_rate) * factor. The factor is 1.0 until
 * MIN_SAMPLES delays have been recorded, then clamp(avg * 1.2, 0.5, 2.0)
 * over the last HISTORY_LIMIT delays. Shared by all port tasks.
 */
class RateLimiter {
public:
    static constexpr size_t HISTORY_LIMIT = 100;
    static constexpr size_t MIN_SAMPLES = 10;

    explicit RateLimiter(int max_rate);

    /** @brief Computes and records the next delay in seconds, without sleeping. */
    double nextDelay();

    /** @brief Sleeps for nextDelay() seconds. */
    void wait();

    double adaptationFactor() const;
    size_t historySize() const;

private:
    mutable std::mutex mutex_;
    double base_delay_;
    double factor_;
    std::deque<double> history_;
};

#endif // RATE_LIMITER_HPP
