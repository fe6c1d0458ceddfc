#include "../include/SampleCollector.hpp"
#include "../include/Logger.hpp"
#include <algorithm>

SampleCollector::SampleCollector(const std::vector<Target>& targets) {
    slots_.reserve(targets.size());
    for (const auto& target : targets) {
        if (index_.count(target.ip_address) != 0) {
            LOG_WARNING("[SampleCollector] Duplicate target " + target.ip_address +
                        " ignored, attempts are folded into the first entry");
            continue;
        }
        auto slot = std::make_unique<TargetSlot>();
        slot->target_ip = target.ip_address;
        slot->effective_country_code = target.effectiveCountryCode();
        index_[target.ip_address] = slots_.size();
        slots_.push_back(std::move(slot));
    }
}

bool SampleCollector::record(const ProbeAttempt& attempt) {
    auto it = index_.find(attempt.target_ip);
    if (it == index_.end()) {
        LOG_WARNING("[SampleCollector] Attempt for unknown target " + attempt.target_ip + " dropped");
        return false;
    }

    TargetSlot& slot = *slots_[it->second];
    std::lock_guard<std::mutex> lock(slot.mutex);
    bool inserted = slot.attempts.emplace(attempt.sequence_number, attempt).second;
    if (!inserted) {
        LOG_WARNING("[SampleCollector] Duplicate sequence " + std::to_string(attempt.sequence_number) +
                    " for " + attempt.target_ip + " dropped");
    }
    return inserted;
}

std::vector<TargetSummary> SampleCollector::summarize() const {
    std::vector<TargetSummary> summaries;
    summaries.reserve(slots_.size());

    for (const auto& slot : slots_) {
        std::vector<ProbeAttempt> attempts;
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            attempts.reserve(slot->attempts.size());
            for (const auto& entry : slot->attempts) {
                attempts.push_back(entry.second);
            }
        }
        summaries.push_back(fold(slot->target_ip, slot->effective_country_code, attempts));
    }

    return summaries;
}

TargetSummary SampleCollector::fold(const std::string& target_ip,
                                    const std::string& effective_country_code,
                                    const std::vector<ProbeAttempt>& attempts) {
    std::vector<const ProbeAttempt*> ordered;
    ordered.reserve(attempts.size());
    for (const auto& attempt : attempts) {
        if (attempt.target_ip == target_ip) {
            ordered.push_back(&attempt);
        }
    }
    // Total order so repeated sequence numbers cannot make the result arrival dependent.
    std::sort(ordered.begin(), ordered.end(),
              [](const ProbeAttempt* a, const ProbeAttempt* b) {
                  if (a->sequence_number != b->sequence_number) {
                      return a->sequence_number < b->sequence_number;
                  }
                  if (a->outcome != b->outcome) {
                      return a->outcome < b->outcome;
                  }
                  return a->rtt_ms < b->rtt_ms;
              });

    TargetSummary summary;
    summary.target_ip = target_ip;
    summary.effective_country_code = effective_country_code;

    for (const ProbeAttempt* attempt : ordered) {
        summary.attempted_count++;
        if (attempt->rejected) {
            summary.rejected = true;
        }
        if (attempt->isSuccess()) {
            summary.samples.push_back(attempt->rtt_ms);
        } else {
            summary.failed_count++;
        }
    }

    return summary;
}
