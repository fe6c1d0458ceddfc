#ifndef PROBE_SCHEDULER_HPP
#define PROBE_SCHEDULER_HPP

#include "Prober.hpp"
#include "RunDeadline.hpp"
#include "../ur-resolverbench-shared/include/RunConfigSerializer.hpp"
#include <functional>
#include <vector>

using ResolverBench::Shared::ProbeConfig;

// Receives every attempt as it completes. Called concurrently from workers.
using AttemptSink = std::function<void(const ProbeAttempt&)>;

struct ScheduleReport {
    size_t targets;
    size_t rejected_targets;
    size_t issued_attempts;
    size_t skipped_attempts;    // not issued because the run deadline passed
    size_t max_in_flight;
    bool truncated;

    ScheduleReport()
        : targets(0),
          rejected_targets(0),
          issued_attempts(0),
          skipped_attempts(0),
          max_in_flight(0),
          truncated(false) {}
};

/**
 * @brief Runs `rounds` echo attempts against every target through a pool of
 * at most `concurrency` workers.
 *
 * Work is queued round by round so that attempts against different targets
 * interleave. Sequence numbers are assigned at enqueue time (0..rounds-1).
 * Targets whose address does not parse get `rounds` ERROR attempts marked
 * as rejected without touching the network.
 */
class ProbeScheduler {
public:
    // Throws std::invalid_argument for rounds < 1, timeout_ms <= 0 or concurrency <= 0.
    ProbeScheduler(Prober& prober, const ProbeConfig& config, RunDeadline& deadline);

    ScheduleReport run(const std::vector<Target>& targets, const AttemptSink& sink);

private:
    Prober& prober_;
    ProbeConfig config_;
    RunDeadline& deadline_;
};

#endif // PROBE_SCHEDULER_HPP
