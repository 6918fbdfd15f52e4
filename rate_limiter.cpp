#include "rate_limiter.hpp"

#include <algorithm>
#include <chrono>
#include <numeric>
#include <thread>

RateLimiter::RateLimiter(int max_rate)
    : base_delay_(1.0 / std::max(1, max_rate)), factor_(1.0) {}

double RateLimiter::nextDelay() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (history_.size() >= MIN_SAMPLES) {
        double average = std::accumulate(history_.begin(), history_.end(), 0.0) /
                         static_cast<double>(history_.size());
        factor_ = std::max(0.5, std::min(2.0, average * 1.2));
    }
    double delay = base_delay_ * factor_;
    history_.push_back(delay);
    if (history_.size() > HISTORY_LIMIT) history_.pop_front();
    return delay;
}

void RateLimiter::wait() {
    double delay = nextDelay();
    std::this_thread::sleep_for(std::chrono::duration<double>(delay));
}

double RateLimiter::adaptationFactor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return factor_;
}

size_t RateLimiter::historySize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}
