#ifndef RUN_DEADLINE_HPP
#define RUN_DEADLINE_HPP

#include <atomic>
#include <chrono>

/**
 * @brief Global stop condition for a campaign.
 *
 * Combines an optional wall-clock budget with an external cancel request
 * (SIGINT). Workers check expired() before issuing new work; work already
 * in flight is left to finish or time out on its own.
 */
class RunDeadline {
public:
    using Clock = std::chrono::steady_clock;

    RunDeadline();
    RunDeadline(const RunDeadline&) = delete;
    RunDeadline& operator=(const RunDeadline&) = delete;

    // A budget of zero or less leaves the run unbounded.
    void setBudget(std::chrono::milliseconds budget);
    bool hasBudget() const;

    void cancel();
    bool cancelled() const;

    bool expired() const;

    // Set once expired() has returned true.
    bool wasHit() const;

private:
    std::atomic<bool> has_budget_;
    std::atomic<Clock::rep> deadline_ticks_;
    std::atomic<bool> cancelled_;
    mutable std::atomic<bool> hit_;
};

#endif // RUN_DEADLINE_HPP
