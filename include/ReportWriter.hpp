#ifndef REPORT_WRITER_HPP
#define REPORT_WRITER_HPP

#include "../ur-resolverbench-shared/include/CountryStatsSerializer.hpp"
#include "../ur-resolverbench-shared/include/RunConfigSerializer.hpp"
#include "../ur-resolverbench-shared/include/TargetSerializer.hpp"
#include <optional>
#include <string>
#include <vector>

using ResolverBench::Shared::CampaignReport;
using ResolverBench::Shared::CountryStats;
using ResolverBench::Shared::OutputConfig;
using ResolverBench::Shared::Target;

class ReportWriter {
public:
    // Ascending min RTT; fully unreachable countries last, by country code.
    static std::vector<CountryStats> sortForReport(const std::vector<CountryStats>& stats);

    static std::string formatCountryCsv(const std::vector<CountryStats>& stats, const OutputConfig& config);
    static std::string formatCorrectedTargetsCsv(const std::vector<Target>& targets);

    // Three decimals; empty when the value is absent.
    static std::string formatLatency(const std::optional<double>& value, bool decimal_comma);

    static bool writeCountryCsv(const std::vector<CountryStats>& stats, const OutputConfig& config);
    static bool writeCorrectedTargets(const std::vector<Target>& targets, const std::string& path);
    static bool writeJsonReport(const CampaignReport& report, const std::string& path);

    // Writes <path>.tmp then renames it over path.
    static bool writeFileAtomic(const std::string& path, const std::string& content);
};

#endif // REPORT_WRITER_HPP
