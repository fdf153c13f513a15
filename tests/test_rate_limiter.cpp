/// @file test_rate_limiter.cpp
/// Unit tests for rate_limiter.hpp: jittered request pacing.

#include "rate_limiter.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <thread>

using namespace shop_harvest;

namespace {

using SteadyClock = std::chrono::steady_clock;

double secondsSince(SteadyClock::time_point start) {
    return std::chrono::duration<double>(SteadyClock::now() - start).count();
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST(RateLimiter, FreshLimiterHasZeroStats) {
    RateLimiter rl(0.1, 0.2);
    EXPECT_DOUBLE_EQ(rl.minWait(), 0.1);
    EXPECT_DOUBLE_EQ(rl.maxWait(), 0.2);
    EXPECT_DOUBLE_EQ(rl.totalSleepSeconds(), 0.0);
    EXPECT_EQ(rl.callCount(), 0);
}

TEST(RateLimiter, NegativeBoundThrows) {
    EXPECT_THROW(RateLimiter(-0.1, 1.0), std::invalid_argument);
}

TEST(RateLimiter, InvertedBoundsThrow) {
    EXPECT_THROW(RateLimiter(2.0, 1.0), std::invalid_argument);
}

TEST(RateLimiter, FromRequestsPerSecondUsesEightyAndHundredTwentyPercent) {
    auto rl = RateLimiter::fromRequestsPerSecond(2.0);
    EXPECT_DOUBLE_EQ(rl.minWait(), 0.4);
    EXPECT_DOUBLE_EQ(rl.maxWait(), 0.6);
}

TEST(RateLimiter, NonPositiveRateThrows) {
    EXPECT_THROW(RateLimiter::fromRequestsPerSecond(0.0), std::invalid_argument);
    EXPECT_THROW(RateLimiter::fromRequestsPerSecond(-3.0), std::invalid_argument);
}

// ============================================================================
// wait()
// ============================================================================

TEST(RateLimiter, FirstCallNeverBlocks) {
    RateLimiter rl(5.0, 5.0);
    auto start = SteadyClock::now();
    rl.wait();
    EXPECT_LT(secondsSince(start), 0.5);
    EXPECT_EQ(rl.callCount(), 1);
    EXPECT_DOUBLE_EQ(rl.totalSleepSeconds(), 0.0);
}

TEST(RateLimiter, ConsecutiveCallsStayWithinBounds) {
    const double minWait = 0.05;
    const double maxWait = 0.10;
    const int    calls   = 6;

    RateLimiter rl(minWait, maxWait);
    auto start = SteadyClock::now();
    for (int i = 0; i < calls; ++i) {
        rl.wait();
    }
    const double elapsed = secondsSince(start);

    // (N-1) gaps; generous upper slack for loaded CI machines.
    EXPECT_GE(elapsed, (calls - 1) * minWait - 0.01);
    EXPECT_LE(elapsed, (calls - 1) * maxWait + 0.25);
    EXPECT_EQ(rl.callCount(), calls);
    EXPECT_GT(rl.totalSleepSeconds(), 0.0);
}

TEST(RateLimiter, TimeSpentElsewhereCountsTowardTheGap) {
    RateLimiter rl(0.1, 0.1);
    rl.wait();
    std::this_thread::sleep_for(std::chrono::milliseconds(150));

    auto start = SteadyClock::now();
    rl.wait();
    EXPECT_LT(secondsSince(start), 0.05);
}

TEST(RateLimiter, ResetMakesNextCallImmediate) {
    RateLimiter rl(2.0, 2.0);
    rl.wait();
    rl.reset();

    auto start = SteadyClock::now();
    rl.wait();
    EXPECT_LT(secondsSince(start), 0.5);
}

TEST(RateLimiter, ZeroBoundsNeverSleep) {
    RateLimiter rl(0.0, 0.0);
    auto start = SteadyClock::now();
    for (int i = 0; i < 100; ++i) {
        rl.wait();
    }
    EXPECT_LT(secondsSince(start), 0.5);
    EXPECT_DOUBLE_EQ(rl.totalSleepSeconds(), 0.0);
}
