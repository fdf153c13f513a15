#include "rate_limiter.hpp"
#include "logging.hpp"

#include <random>
#include <stdexcept>
#include <thread>

namespace shop_harvest {

RateLimiter::RateLimiter(double minWaitSeconds, double maxWaitSeconds)
    : mMinWait(minWaitSeconds)
    , mMaxWait(maxWaitSeconds)
{
    if (mMinWait < 0.0 || mMaxWait < 0.0) {
        throw std::invalid_argument("RateLimiter: wait bounds must be non-negative");
    }
    if (mMinWait > mMaxWait) {
        throw std::invalid_argument("RateLimiter: min_wait exceeds max_wait");
    }

    SH_LOG_DEBUG("RateLimiter", "min_wait=" << mMinWait << "s, max_wait=" << mMaxWait << "s");
}

RateLimiter RateLimiter::fromRequestsPerSecond(double requestsPerSecond) {
    if (requestsPerSecond <= 0.0) {
        throw std::invalid_argument("RateLimiter: requests_per_second must be positive");
    }
    const double interval = 1.0 / requestsPerSecond;
    return RateLimiter(interval * 0.8, interval * 1.2);
}

void RateLimiter::wait() {
    ++mCallCount;

    if (mLastCall) {
        static thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_real_distribution<double> dist(mMinWait, mMaxWait);
        const double target = (mMaxWait > mMinWait) ? dist(rng) : mMinWait;

        const std::chrono::duration<double> elapsed = SteadyClock::now() - *mLastCall;
        const double sleepSeconds = target - elapsed.count();

        if (sleepSeconds > 0.0) {
            SH_LOG_DEBUG("RateLimiter", "sleeping " << sleepSeconds << "s");
            mTotalSleep += sleepSeconds;
            std::this_thread::sleep_for(std::chrono::duration<double>(sleepSeconds));
        }
    }

    mLastCall = SteadyClock::now();
}

void RateLimiter::reset() {
    mLastCall.reset();
    SH_LOG_DEBUG("RateLimiter", "reset");
}

} // namespace shop_harvest
