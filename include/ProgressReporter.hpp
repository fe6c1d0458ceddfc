#ifndef PROGRESS_REPORTER_HPP
#define PROGRESS_REPORTER_HPP

#include <atomic>
#include <mutex>
#include <string>

// Logs "<label> NN.N%" every time completed work crosses another 5% step.
class ProgressReporter {
public:
    ProgressReporter(const std::string& label, size_t total);

    void advance();
    size_t completed() const;

private:
    std::string label_;
    size_t total_;
    std::atomic<size_t> completed_;
    std::mutex report_mutex_;
    double last_reported_pct_;
};

#endif // PROGRESS_REPORTER_HPP
