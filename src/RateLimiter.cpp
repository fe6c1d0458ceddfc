#include "../include/RateLimiter.hpp"
#include <thread>

RateLimiter::RateLimiter(std::chrono::milliseconds interval)
    : interval_(interval),
      next_slot_(std::chrono::steady_clock::now()) {
}

void RateLimiter::acquire() {
    if (interval_.count() <= 0) {
        return;
    }

    std::chrono::steady_clock::time_point slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        slot = next_slot_ > now ? next_slot_ : now;
        next_slot_ = slot + interval_;
    }
    std::this_thread::sleep_until(slot);
}
