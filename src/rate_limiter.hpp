#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace shop_harvest {

/// Paces successive outbound requests with a jittered minimum gap.
///
/// wait() blocks until a randomly chosen interval in [minWait, maxWait] has
/// elapsed since the previous wait() returned.  The first call never blocks.
/// No retry or backoff logic lives here.
class RateLimiter {
public:
    /// @param minWaitSeconds  Lower bound of the inter-request gap.
    /// @param maxWaitSeconds  Upper bound of the inter-request gap.
    /// @throws std::invalid_argument on negative or inverted bounds.
    RateLimiter(double minWaitSeconds = 1.0, double maxWaitSeconds = 2.0);

    /// Bounds of 0.8/rps and 1.2/rps.
    /// @throws std::invalid_argument if @p requestsPerSecond <= 0.
    static RateLimiter fromRequestsPerSecond(double requestsPerSecond);

    void wait();

    /// Forget the previous call, so the next wait() returns immediately.
    void reset();

    double minWait() const { return mMinWait; }
    double maxWait() const { return mMaxWait; }

    // ---- accessors for summary report ----
    double totalSleepSeconds() const { return mTotalSleep; }
    int    callCount()         const { return mCallCount; }

private:
    using SteadyClock = std::chrono::steady_clock;

    double mMinWait;
    double mMaxWait;

    std::optional<SteadyClock::time_point> mLastCall;

    double mTotalSleep = 0.0;
    int    mCallCount  = 0;
};

} // namespace shop_harvest
