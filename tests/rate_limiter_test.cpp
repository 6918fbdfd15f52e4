#include <gtest/gtest.h>

#include <chrono>

#include "rate_limiter.hpp"

TEST(RateLimiterTest, BaseDelayUntilEnoughSamples) {
    RateLimiter limiter(200);
    for (size_t i = 0; i < RateLimiter::MIN_SAMPLES; ++i) {
        EXPECT_DOUBLE_EQ(limiter.nextDelay(), 1.0 / 200);
        EXPECT_DOUBLE_EQ(limiter.adaptationFactor(), 1.0);
    }
    EXPECT_EQ(limiter.historySize(), RateLimiter::MIN_SAMPLES);
}

TEST(RateLimiterTest, FastRatesClampToLowerBound) {
    RateLimiter limiter(1000);
    for (size_t i = 0; i < RateLimiter::MIN_SAMPLES; ++i) limiter.nextDelay();
    EXPECT_DOUBLE_EQ(limiter.nextDelay(), 0.5 / 1000);
    EXPECT_DOUBLE_EQ(limiter.adaptationFactor(), 0.5);
}

TEST(RateLimiterTest, FactorStaysWithinBounds) {
    for (int rate : {1, 2, 3, 10, 500}) {
        RateLimiter limiter(rate);
        for (int i = 0; i < 250; ++i) {
            double delay = limiter.nextDelay();
            double factor = limiter.adaptationFactor();
            EXPECT_GE(factor, 0.5);
            EXPECT_LE(factor, 2.0);
            EXPECT_DOUBLE_EQ(delay, factor / rate);
        }
        EXPECT_EQ(limiter.historySize(), RateLimiter::HISTORY_LIMIT);
    }
}

TEST(RateLimiterTest, SlowRatesClampToUpperBound) {
    RateLimiter limiter(1);
    for (int i = 0; i < 200; ++i) limiter.nextDelay();
    EXPECT_DOUBLE_EQ(limiter.adaptationFactor(), 2.0);
}

TEST(RateLimiterTest, NonPositiveRateIsTreatedAsOne) {
    RateLimiter limiter(0);
    EXPECT_DOUBLE_EQ(limiter.nextDelay(), 1.0);
}

TEST(RateLimiterTest, WaitSleepsForTheDelay) {
    RateLimiter limiter(50);
    auto start = std::chrono::steady_clock::now();
    limiter.wait();
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, std::chrono::milliseconds(19));
    EXPECT_EQ(limiter.historySize(), 1u);
}
