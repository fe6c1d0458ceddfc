#ifndef RATE_LIMITER_HPP
#define RATE_LIMITER_HPP

#include <chrono>
#include <mutex>

// Spaces the start of consecutive operations at least `interval` apart,
// across all calling threads. The lock is only held while reserving a slot.
class RateLimiter {
public:
    explicit RateLimiter(std::chrono::milliseconds interval);

    void acquire();

private:
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point next_slot_;
    std::mutex mutex_;
};

#endif // RATE_LIMITER_HPP
