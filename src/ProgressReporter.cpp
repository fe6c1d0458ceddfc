#include "../include/ProgressReporter.hpp"
#include "../include/Logger.hpp"
#include <iomanip>
#include <sstream>

namespace {
const double kReportStepPct = 5.0;
}

ProgressReporter::ProgressReporter(const std::string& label, size_t total)
    : label_(label),
      total_(total),
      completed_(0),
      last_reported_pct_(0.0) {
}

void ProgressReporter::advance() {
    size_t done = ++completed_;
    if (total_ == 0) {
        return;
    }

    double pct = (static_cast<double>(done) / static_cast<double>(total_)) * 100.0;

    std::lock_guard<std::mutex> lock(report_mutex_);
    if (pct >= last_reported_pct_ + kReportStepPct || (done == total_ && last_reported_pct_ < 100.0)) {
        last_reported_pct_ = pct;
        std::ostringstream ss;
        ss << "[" << label_ << "] " << std::fixed << std::setprecision(1) << pct
           << "% [" << done << "/" << total_ << "]";
        LOG_INFO(ss.str());
    }
}

size_t ProgressReporter::completed() const {
    return completed_.load();
}
