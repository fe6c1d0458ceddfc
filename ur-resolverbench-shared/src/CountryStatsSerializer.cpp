#include "../include/CountryStatsSerializer.hpp"
#include <cstdio>
#include <fstream>

namespace ResolverBench {
namespace Shared {

namespace {

json optionalToJson(const std::optional<double>& value) {
    if (value) {
        return json(*value);
    }
    return json(nullptr);
}

std::optional<double> jsonToOptional(const json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<double>();
    }
    return std::nullopt;
}

} // namespace

json CountryStatsSerializer::serializeStats(const CountryStats& stats) {
    json j;
    j["country_code"] = stats.country_code;
    j["min_ms"] = optionalToJson(stats.min_ms);
    j["avg_ms"] = optionalToJson(stats.avg_ms);
    j["median_ms"] = optionalToJson(stats.median_ms);
    j["max_ms"] = optionalToJson(stats.max_ms);
    j["server_count"] = stats.server_count;
    j["unreachable_count"] = stats.unreachable_count;
    return j;
}

CountryStats CountryStatsSerializer::deserializeStats(const json& j) {
    CountryStats stats;
    stats.country_code = j.value("country_code", "");
    stats.min_ms = jsonToOptional(j, "min_ms");
    stats.avg_ms = jsonToOptional(j, "avg_ms");
    stats.median_ms = jsonToOptional(j, "median_ms");
    stats.max_ms = jsonToOptional(j, "max_ms");
    stats.server_count = j.value("server_count", 0);
    stats.unreachable_count = j.value("unreachable_count", 0);
    return stats;
}

json CountryStatsSerializer::serializeReport(const CampaignReport& report) {
    json j;
    j["timestamp"] = report.timestamp;
    j["total_targets"] = report.total_targets;
    j["reachable_targets"] = report.reachable_targets;
    j["unreachable_targets"] = report.unreachable_targets;
    j["rejected_targets"] = report.rejected_targets;
    j["corrected_targets"] = report.corrected_targets;
    j["truncated"] = report.truncated;

    json countries = json::array();
    for (const auto& stats : report.countries) {
        countries.push_back(serializeStats(stats));
    }
    j["countries"] = countries;
    j["targets"] = TargetSerializer::serializeTargets(report.targets);

    json summaries = json::array();
    for (const auto& summary : report.summaries) {
        summaries.push_back(ProbeAttemptSerializer::serializeSummary(summary));
    }
    j["summaries"] = summaries;

    return j;
}

CampaignReport CountryStatsSerializer::deserializeReport(const json& j) {
    CampaignReport report;
    report.timestamp = j.value("timestamp", "");
    report.total_targets = j.value("total_targets", 0);
    report.reachable_targets = j.value("reachable_targets", 0);
    report.unreachable_targets = j.value("unreachable_targets", 0);
    report.rejected_targets = j.value("rejected_targets", 0);
    report.corrected_targets = j.value("corrected_targets", 0);
    report.truncated = j.value("truncated", false);

    if (j.contains("countries") && j["countries"].is_array()) {
        for (const auto& stats_json : j["countries"]) {
            report.countries.push_back(deserializeStats(stats_json));
        }
    }
    if (j.contains("targets")) {
        report.targets = TargetSerializer::deserializeTargets(j["targets"]);
    }
    if (j.contains("summaries") && j["summaries"].is_array()) {
        for (const auto& summary_json : j["summaries"]) {
            report.summaries.push_back(ProbeAttemptSerializer::deserializeSummary(summary_json));
        }
    }

    return report;
}

bool CountryStatsSerializer::exportToFile(const CampaignReport& report, const std::string& filepath) {
    // Catalog text is not guaranteed to be UTF-8; invalid bytes become U+FFFD.
    std::string content;
    try {
        content = serializeReport(report).dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception&) {
        return false;
    }

    // Atomic write: write to temp file, then rename
    std::string temp_file = filepath + ".tmp";
    std::ofstream file(temp_file, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file << content;
    file.close();
    if (file.fail()) {
        std::remove(temp_file.c_str());
        return false;
    }
    return std::rename(temp_file.c_str(), filepath.c_str()) == 0;
}

} // namespace Shared
} // namespace ResolverBench
