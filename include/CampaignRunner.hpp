#ifndef CAMPAIGN_RUNNER_HPP
#define CAMPAIGN_RUNNER_HPP

#include "CountryReconciler.hpp"
#include "GeoProvider.hpp"
#include "ProbeScheduler.hpp"
#include "Prober.hpp"
#include "RunDeadline.hpp"
#include "../ur-resolverbench-shared/include/CountryStatsSerializer.hpp"
#include "../ur-resolverbench-shared/include/ProbeAttemptSerializer.hpp"
#include "../ur-resolverbench-shared/include/RunConfigSerializer.hpp"
#include <vector>

using ResolverBench::Shared::CampaignReport;
using ResolverBench::Shared::CountryStats;
using ResolverBench::Shared::RunConfig;
using ResolverBench::Shared::TargetSummary;

struct CampaignResult {
    std::vector<Target> targets;            // with reconciled countries
    std::vector<TargetSummary> summaries;
    std::vector<CountryStats> countries;
    ReconcileReport reconcile;
    ScheduleReport schedule;
    bool reconciled;
    bool truncated;

    CampaignResult() : reconciled(false), truncated(false) {}
};

/**
 * @brief One measurement campaign: reconcile -> probe -> collect -> aggregate.
 *
 * The provider may be null, in which case every target keeps its claimed
 * country. Reconciliation of the whole target list finishes before the
 * collector is built, so each target's country is final before its samples
 * are bucketed.
 */
class CampaignRunner {
public:
    CampaignRunner(const RunConfig& config, Prober& prober, GeoProvider* provider, RunDeadline& deadline);

    CampaignResult run(const std::vector<Target>& targets);

    static CampaignReport buildReport(const CampaignResult& result);

    bool writeReports(const CampaignResult& result) const;

    // Loads the catalog, runs against the network and writes every report.
    // Returns the process exit code.
    static int execute(const RunConfig& config, RunDeadline& deadline);

private:
    RunConfig config_;
    Prober& prober_;
    GeoProvider* provider_;
    RunDeadline& deadline_;
};

#endif // CAMPAIGN_RUNNER_HPP
