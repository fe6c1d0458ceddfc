#ifndef SAMPLE_COLLECTOR_HPP
#define SAMPLE_COLLECTOR_HPP

#include "../ur-resolverbench-shared/include/ProbeAttemptSerializer.hpp"
#include "../ur-resolverbench-shared/include/TargetSerializer.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

using ResolverBench::Shared::ProbeAttempt;
using ResolverBench::Shared::Target;
using ResolverBench::Shared::TargetSummary;

/**
 * @brief Folds probe attempts into one TargetSummary per target.
 *
 * The target set and each target's effective country are fixed at
 * construction, so reconciliation has to be finished before the collector
 * is built. record() may be called from any number of threads; each target
 * has its own slot and lock. Summaries depend only on the set of attempts
 * received, never on their arrival order.
 */
class SampleCollector {
public:
    explicit SampleCollector(const std::vector<Target>& targets);

    // False for attempts naming an unknown target or repeating a sequence number.
    bool record(const ProbeAttempt& attempt);

    // One summary per target, in catalog order.
    std::vector<TargetSummary> summarize() const;

    static TargetSummary fold(const std::string& target_ip,
                              const std::string& effective_country_code,
                              const std::vector<ProbeAttempt>& attempts);

private:
    struct TargetSlot {
        std::string target_ip;
        std::string effective_country_code;
        std::map<int, ProbeAttempt> attempts;   // keyed by sequence number
        mutable std::mutex mutex;
    };

    std::vector<std::unique_ptr<TargetSlot>> slots_;
    std::unordered_map<std::string, size_t> index_;
};

#endif // SAMPLE_COLLECTOR_HPP
