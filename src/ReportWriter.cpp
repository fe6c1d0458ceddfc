#include "../include/ReportWriter.hpp"
#include "../include/Logger.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>

using ResolverBench::Shared::CountryStatsSerializer;

std::vector<CountryStats> ReportWriter::sortForReport(const std::vector<CountryStats>& stats) {
    std::vector<CountryStats> sorted = stats;
    std::stable_sort(sorted.begin(), sorted.end(), [](const CountryStats& a, const CountryStats& b) {
        if (a.min_ms.has_value() != b.min_ms.has_value()) {
            return a.min_ms.has_value();
        }
        if (a.min_ms && b.min_ms && *a.min_ms != *b.min_ms) {
            return *a.min_ms < *b.min_ms;
        }
        return a.country_code < b.country_code;
    });
    return sorted;
}

std::string ReportWriter::formatLatency(const std::optional<double>& value, bool decimal_comma) {
    if (!value) {
        return "";
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3) << *value;
    std::string text = ss.str();
    if (decimal_comma) {
        std::replace(text.begin(), text.end(), '.', ',');
    }
    return text;
}

std::string ReportWriter::formatCountryCsv(const std::vector<CountryStats>& stats, const OutputConfig& config) {
    const std::string& d = config.csv_delimiter;
    std::ostringstream csv;

    csv << "Country" << d << "Min RTT" << d << "Median RTT" << d << "Average RTT" << d
        << "Max RTT" << d << "Servers" << d << "Unreachable" << "\n";

    for (const auto& s : sortForReport(stats)) {
        csv << s.country_code << d
            << formatLatency(s.min_ms, config.decimal_comma) << d
            << formatLatency(s.median_ms, config.decimal_comma) << d
            << formatLatency(s.avg_ms, config.decimal_comma) << d
            << formatLatency(s.max_ms, config.decimal_comma) << d
            << s.server_count << d
            << s.unreachable_count << "\n";
    }

    return csv.str();
}

std::string ReportWriter::formatCorrectedTargetsCsv(const std::vector<Target>& targets) {
    std::ostringstream csv;
    csv << "ip_address,claimed_country_code,resolved_country_code,city\n";

    for (const auto& target : targets) {
        std::string city = target.city;
        bool quote = city.find_first_of(",\"") != std::string::npos;
        if (quote) {
            std::string escaped;
            for (char c : city) {
                if (c == '"') escaped += '"';
                escaped += c;
            }
            city = "\"" + escaped + "\"";
        }

        csv << target.ip_address << ","
            << target.claimed_country_code << ","
            << target.resolved_country_code.value_or("") << ","
            << city << "\n";
    }

    return csv.str();
}

bool ReportWriter::writeFileAtomic(const std::string& path, const std::string& content) {
    std::string temp_file = path + ".tmp";
    std::ofstream out(temp_file, std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("[ReportWriter] Cannot open " + temp_file + " for writing");
        return false;
    }
    out << content;
    out.close();
    if (out.fail()) {
        LOG_ERROR("[ReportWriter] Failed writing " + temp_file);
        std::remove(temp_file.c_str());
        return false;
    }
    if (std::rename(temp_file.c_str(), path.c_str()) != 0) {
        LOG_ERROR("[ReportWriter] Failed to move " + temp_file + " to " + path);
        std::remove(temp_file.c_str());
        return false;
    }
    return true;
}

bool ReportWriter::writeCountryCsv(const std::vector<CountryStats>& stats, const OutputConfig& config) {
    if (!writeFileAtomic(config.csv_file, formatCountryCsv(stats, config))) {
        return false;
    }
    LOG_INFO("[ReportWriter] Wrote country statistics to " + config.csv_file);
    return true;
}

bool ReportWriter::writeCorrectedTargets(const std::vector<Target>& targets, const std::string& path) {
    if (!writeFileAtomic(path, formatCorrectedTargetsCsv(targets))) {
        return false;
    }
    LOG_INFO("[ReportWriter] Wrote corrected targets to " + path);
    return true;
}

bool ReportWriter::writeJsonReport(const CampaignReport& report, const std::string& path) {
    if (!CountryStatsSerializer::exportToFile(report, path)) {
        LOG_ERROR("[ReportWriter] Failed to write JSON report to " + path);
        return false;
    }
    LOG_INFO("[ReportWriter] Wrote JSON report to " + path);
    return true;
}
