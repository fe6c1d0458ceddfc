#include "../include/ProbeScheduler.hpp"
#include "../include/AddressUtils.hpp"
#include "../include/Logger.hpp"
#include "../include/ProgressReporter.hpp"
#include "../include/WorkerPool.hpp"
#include <algorithm>
#include <atomic>
#include <stdexcept>

ProbeScheduler::ProbeScheduler(Prober& prober, const ProbeConfig& config, RunDeadline& deadline)
    : prober_(prober),
      config_(config),
      deadline_(deadline) {
    if (config_.rounds < 1) {
        throw std::invalid_argument("probe rounds must be at least 1");
    }
    if (config_.timeout_ms <= 0) {
        throw std::invalid_argument("probe timeout must be positive");
    }
    if (config_.concurrency <= 0) {
        throw std::invalid_argument("probe concurrency must be positive");
    }
}

ScheduleReport ProbeScheduler::run(const std::vector<Target>& targets, const AttemptSink& sink) {
    ScheduleReport report;
    report.targets = targets.size();

    std::vector<const Target*> probe_targets;
    probe_targets.reserve(targets.size());

    for (const auto& target : targets) {
        if (is_valid_ip_address(target.ip_address)) {
            probe_targets.push_back(&target);
            continue;
        }

        LOG_WARNING("[ProbeScheduler] Rejecting target with malformed address '" +
                    target.ip_address + "' (" + target.claimed_country_code + ")");
        report.rejected_targets++;
        for (int round = 0; round < config_.rounds; round++) {
            ProbeAttempt attempt = ProbeAttempt::failure(target.ip_address, round, ProbeOutcome::ERROR,
                                                         "Invalid IP address");
            attempt.rejected = true;
            sink(attempt);
        }
    }

    size_t total_attempts = probe_targets.size() * static_cast<size_t>(config_.rounds);
    if (total_attempts == 0) {
        return report;
    }

    size_t worker_count = std::min(static_cast<size_t>(config_.concurrency), total_attempts);
    LOG_INFO("[ProbeScheduler] Probing " + std::to_string(probe_targets.size()) + " targets x " +
             std::to_string(config_.rounds) + " rounds with " + std::to_string(worker_count) +
             " concurrent probes (timeout " + std::to_string(config_.timeout_ms) + " ms)");

    ProgressReporter progress("ProbeScheduler", total_attempts);
    std::atomic<size_t> issued(0);
    std::atomic<size_t> skipped(0);
    std::atomic<size_t> in_flight(0);
    std::atomic<size_t> max_in_flight(0);
    const int timeout_ms = config_.timeout_ms;

    {
        WorkerPool pool("ProbePool", worker_count);

        for (int round = 0; round < config_.rounds; round++) {
            for (const Target* target : probe_targets) {
                bool queued = pool.submit([&, target, round](size_t) {
                    if (deadline_.expired()) {
                        skipped++;
                        progress.advance();
                        return;
                    }

                    size_t now_in_flight = ++in_flight;
                    size_t seen = max_in_flight.load();
                    while (now_in_flight > seen && !max_in_flight.compare_exchange_weak(seen, now_in_flight)) {
                    }
                    issued++;

                    ProbeAttempt attempt = prober_.probe(*target, round, timeout_ms);
                    in_flight--;

                    sink(attempt);
                    progress.advance();
                });
                if (!queued) {
                    skipped++;
                }
            }
        }

        pool.waitIdle();
        pool.shutdown();
    }

    report.issued_attempts = issued.load();
    report.skipped_attempts = skipped.load();
    report.max_in_flight = max_in_flight.load();
    report.truncated = report.skipped_attempts > 0;

    if (report.truncated) {
        LOG_WARNING("[ProbeScheduler] Run deadline reached, " + std::to_string(report.skipped_attempts) +
                    " attempts were not issued");
    }
    LOG_INFO("[ProbeScheduler] Issued " + std::to_string(report.issued_attempts) + " attempts, " +
             std::to_string(report.rejected_targets) + " targets rejected");

    return report;
}
