#include "../include/CampaignRunner.hpp"
#include "../include/CatalogLoader.hpp"
#include "../include/CountryAggregator.hpp"
#include "../include/FilterUtils.hpp"
#include "../include/IcmpProber.hpp"
#include "../include/IpInfoProvider.hpp"
#include "../include/Logger.hpp"
#include "../include/ReportWriter.hpp"
#include "../include/SampleCollector.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>

using ResolverBench::Shared::ProbeAttemptSerializer;

namespace {

std::string current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time_t, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace

CampaignRunner::CampaignRunner(const RunConfig& config, Prober& prober, GeoProvider* provider,
                               RunDeadline& deadline)
    : config_(config),
      prober_(prober),
      provider_(provider),
      deadline_(deadline) {
}

CampaignResult CampaignRunner::run(const std::vector<Target>& targets) {
    CampaignResult result;
    result.targets = targets;

    // 1. Correct countries
    if (provider_ != nullptr) {
        LOG_INFO("[Campaign] ========== Step 1: Reconciling countries ==========");
        CountryReconciler reconciler(*provider_, config_.lookup, deadline_);
        result.reconcile = reconciler.reconcile(result.targets);
        result.reconciled = true;
    } else {
        LOG_INFO("[Campaign] ========== Step 1: Country reconciliation disabled ==========");
    }

    // 2. Probe
    LOG_INFO("[Campaign] ========== Step 2: Probing targets ==========");
    SampleCollector collector(result.targets);
    ProbeScheduler scheduler(prober_, config_.probe, deadline_);
    const bool trace_attempts = Logger::getInstance().getLogLevel() == LogLevel::DEBUG;
    result.schedule = scheduler.run(result.targets, [&collector, trace_attempts](const ProbeAttempt& attempt) {
        if (trace_attempts) {
            json traced = ProbeAttemptSerializer::serializeAttempt(attempt);
            LOG_DEBUG("[Campaign] " + traced.dump(-1, ' ', false, json::error_handler_t::replace));
        }
        if (!collector.record(attempt)) {
            LOG_WARNING("[Campaign] Dropped attempt " + std::to_string(attempt.sequence_number) +
                        " for " + attempt.target_ip);
        }
    });

    // 3. Aggregate
    LOG_INFO("[Campaign] ========== Step 3: Aggregating per country ==========");
    result.summaries = collector.summarize();
    result.countries = CountryAggregator::aggregate(result.summaries);
    result.truncated = result.schedule.truncated || result.reconcile.truncated;

    LOG_INFO("[Campaign] " + std::to_string(result.countries.size()) + " countries from " +
             std::to_string(result.summaries.size()) + " targets" +
             (result.truncated ? " (truncated by run deadline)" : ""));

    return result;
}

CampaignReport CampaignRunner::buildReport(const CampaignResult& result) {
    CampaignReport report;
    report.timestamp = current_timestamp();
    report.total_targets = static_cast<int>(result.summaries.size());
    report.truncated = result.truncated;
    report.countries = result.countries;
    report.targets = result.targets;
    report.summaries = result.summaries;

    for (const auto& summary : result.summaries) {
        if (summary.rejected) {
            report.rejected_targets++;
        }
        if (summary.isReachable()) {
            report.reachable_targets++;
        } else {
            report.unreachable_targets++;
        }
    }
    for (const auto& target : result.targets) {
        if (target.wasCorrected()) {
            report.corrected_targets++;
        }
    }

    return report;
}

bool CampaignRunner::writeReports(const CampaignResult& result) const {
    LOG_INFO("[Campaign] ========== Step 4: Writing reports ==========");
    bool ok = true;

    if (!config_.output.csv_file.empty()) {
        ok = ReportWriter::writeCountryCsv(result.countries, config_.output) && ok;
    }
    if (!config_.output.json_file.empty()) {
        ok = ReportWriter::writeJsonReport(buildReport(result), config_.output.json_file) && ok;
    }
    if (!config_.output.corrected_targets_file.empty()) {
        ok = ReportWriter::writeCorrectedTargets(result.targets, config_.output.corrected_targets_file) && ok;
    }

    return ok;
}

int CampaignRunner::execute(const RunConfig& config, RunDeadline& deadline) {
    auto started = std::chrono::steady_clock::now();
    deadline.setBudget(std::chrono::seconds(config.run_deadline_sec));

    std::vector<Target> targets;
    if (!CatalogLoader::load(config.catalog, targets)) {
        LOG_ERROR("[Campaign] Failed to load catalog " + config.catalog.path);
        return 1;
    }

    bool has_filters = !config.filters.countries.empty() || !config.filters.keyword.empty();
    if (has_filters) {
        targets = filter_targets(targets, config.filters);
        LOG_INFO("[Campaign] Filtered to " + std::to_string(targets.size()) + " targets");
    }
    if (targets.empty()) {
        LOG_ERROR("[Campaign] No targets to measure");
        return 1;
    }

    IcmpProber prober(config.probe);

    std::unique_ptr<IpInfoProvider> provider;
    if (config.lookup.enabled) {
        if (config.lookup.token.empty()) {
            LOG_WARNING("[Campaign] No ipinfo token configured, anonymous lookups are heavily rate limited");
        }
        provider = std::make_unique<IpInfoProvider>(config.lookup.base_url, config.lookup.token,
                                                    config.lookup.timeout_ms);
    }

    CampaignRunner runner(config, prober, provider.get(), deadline);
    CampaignResult result = runner.run(targets);

    bool written = runner.writeReports(result);

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started);
    LOG_INFO("[Campaign] Done, it took " + std::to_string(elapsed.count()) + "s");

    return written ? 0 : 1;
}
