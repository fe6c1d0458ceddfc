#ifndef COUNTRY_STATS_SERIALIZER_HPP
#define COUNTRY_STATS_SERIALIZER_HPP

#include "ProbeAttemptSerializer.hpp"
#include "TargetSerializer.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace ResolverBench {
namespace Shared {

// Latency figures are absent when no server in the country answered.
struct CountryStats {
    std::string country_code;
    std::optional<double> min_ms;
    std::optional<double> avg_ms;
    std::optional<double> median_ms;
    std::optional<double> max_ms;
    int server_count;
    int unreachable_count;

    CountryStats()
        : server_count(0),
          unreachable_count(0) {}
};

struct CampaignReport {
    std::string timestamp;
    int total_targets;
    int reachable_targets;
    int unreachable_targets;
    int rejected_targets;
    int corrected_targets;
    bool truncated;
    std::vector<CountryStats> countries;
    std::vector<Target> targets;
    std::vector<TargetSummary> summaries;

    CampaignReport()
        : total_targets(0),
          reachable_targets(0),
          unreachable_targets(0),
          rejected_targets(0),
          corrected_targets(0),
          truncated(false) {}
};

class CountryStatsSerializer {
public:
    static json serializeStats(const CountryStats& stats);
    static CountryStats deserializeStats(const json& j);

    static json serializeReport(const CampaignReport& report);
    static CampaignReport deserializeReport(const json& j);

    static bool exportToFile(const CampaignReport& report, const std::string& filepath);
};

} // namespace Shared
} // namespace ResolverBench

#endif // COUNTRY_STATS_SERIALIZER_HPP
