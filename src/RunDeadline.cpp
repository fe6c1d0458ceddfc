#include "../include/RunDeadline.hpp"

RunDeadline::RunDeadline()
    : has_budget_(false),
      deadline_ticks_(0),
      cancelled_(false),
      hit_(false) {
}

void RunDeadline::setBudget(std::chrono::milliseconds budget) {
    if (budget.count() <= 0) {
        has_budget_.store(false);
        return;
    }
    Clock::time_point deadline = Clock::now() + budget;
    deadline_ticks_.store(deadline.time_since_epoch().count());
    has_budget_.store(true);
}

bool RunDeadline::hasBudget() const {
    return has_budget_.load();
}

void RunDeadline::cancel() {
    cancelled_.store(true);
}

bool RunDeadline::cancelled() const {
    return cancelled_.load();
}

bool RunDeadline::expired() const {
    bool expired = cancelled_.load();
    if (!expired && has_budget_.load()) {
        Clock::time_point deadline{Clock::duration(deadline_ticks_.load())};
        expired = Clock::now() >= deadline;
    }
    if (expired) {
        hit_.store(true);
    }
    return expired;
}

bool RunDeadline::wasHit() const {
    return hit_.load();
}
