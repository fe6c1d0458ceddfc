#include "../include/CatalogLoader.hpp"
#include "../include/FilterUtils.hpp"
#include "../include/Logger.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <unordered_set>

using ResolverBench::Shared::CatalogFormat;

namespace {

std::string first_string(const json& record, const std::vector<std::string>& keys) {
    for (const auto& key : keys) {
        if (record.contains(key) && record[key].is_string()) {
            return record[key].get<std::string>();
        }
    }
    return "";
}

bool add_record(const std::string& ip, const std::string& country, const std::string& city,
                std::vector<Target>& targets) {
    std::string clean_ip = trim(ip);
    std::string clean_country = to_upper(trim(country));

    if (clean_ip.empty()) {
        LOG_WARNING("[CatalogLoader] Skipping record without an IP address");
        return false;
    }
    if (!is_country_code(clean_country)) {
        LOG_WARNING("[CatalogLoader] Skipping " + clean_ip + ": invalid country code '" + country + "'");
        return false;
    }

    targets.emplace_back(clean_ip, clean_country, trim(city));
    return true;
}

int column_index(const std::vector<std::string>& header, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        for (size_t i = 0; i < header.size(); i++) {
            if (to_lower(trim(header[i])) == name) {
                return static_cast<int>(i);
            }
        }
    }
    return -1;
}

} // namespace

bool CatalogLoader::load(const CatalogConfig& config, std::vector<Target>& targets) {
    targets.clear();

    bool ok = false;
    switch (config.format) {
        case CatalogFormat::JSON:
            ok = loadJsonFile(config.path, targets);
            break;
        case CatalogFormat::CSV:
            ok = loadCsvFile(config.path, targets);
            break;
        case CatalogFormat::COUNTRY_DIR:
            ok = loadCountryDirectory(config.path, targets);
            break;
        default:
            LOG_ERROR("[CatalogLoader] Unknown catalog format");
            return false;
    }
    if (!ok) {
        return false;
    }

    size_t dropped = collapseDuplicates(targets);
    if (dropped > 0) {
        LOG_WARNING("[CatalogLoader] Collapsed " + std::to_string(dropped) + " duplicate IP records");
    }

    LOG_INFO("[CatalogLoader] Loaded " + std::to_string(targets.size()) + " targets from " + config.path);
    return true;
}

bool CatalogLoader::loadJsonFile(const std::string& path, std::vector<Target>& targets) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("[CatalogLoader] Cannot open catalog file: " + path);
        return false;
    }

    json records;
    try {
        file >> records;
    } catch (const std::exception& e) {
        LOG_ERROR("[CatalogLoader] Error parsing " + path + ": " + e.what());
        return false;
    }

    if (!records.is_array()) {
        LOG_ERROR("[CatalogLoader] Catalog must be an array of records: " + path);
        return false;
    }

    parseJsonRecords(records, "", targets);
    return true;
}

bool CatalogLoader::loadCsvFile(const std::string& path, std::vector<Target>& targets) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("[CatalogLoader] Cannot open catalog file: " + path);
        return false;
    }

    std::string header_line;
    if (!std::getline(file, header_line)) {
        LOG_ERROR("[CatalogLoader] Catalog file is empty: " + path);
        return false;
    }
    file.seekg(0);

    std::vector<std::string> header = splitCsvLine(header_line);
    if (column_index(header, {"ip_address", "ip"}) < 0 ||
        column_index(header, {"country_code", "claimed_country_code", "country"}) < 0) {
        LOG_ERROR("[CatalogLoader] CSV header must name ip_address and country_code columns: " + path);
        return false;
    }

    parseCsv(file, targets);
    return true;
}

bool CatalogLoader::loadCountryDirectory(const std::string& dir, std::vector<Target>& targets) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        LOG_ERROR("[CatalogLoader] Not a directory: " + dir);
        return false;
    }

    std::vector<fs::path> paths;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == ".json") {
            paths.push_back(it->path());
        }
    }
    if (ec) {
        LOG_ERROR("[CatalogLoader] Error reading directory " + dir + ": " + ec.message());
        return false;
    }

    // Directory order is unspecified; keep the target order reproducible.
    std::sort(paths.begin(), paths.end());
    LOG_INFO("[CatalogLoader] Found " + std::to_string(paths.size()) + " country files in " + dir);

    for (const auto& path : paths) {
        std::string stem = path.stem().string();
        std::string country = to_upper(stem.substr(0, stem.find('.')));

        std::ifstream file(path);
        if (!file.is_open()) {
            LOG_WARNING("[CatalogLoader] Cannot open " + path.string() + ", skipping");
            continue;
        }

        json records;
        try {
            file >> records;
        } catch (const std::exception& e) {
            LOG_WARNING("[CatalogLoader] Error parsing " + path.string() + ", skipping: " + e.what());
            continue;
        }
        if (!records.is_array()) {
            LOG_WARNING("[CatalogLoader] " + path.string() + " is not an array, skipping");
            continue;
        }

        parseJsonRecords(records, country, targets);
    }

    return true;
}

size_t CatalogLoader::parseJsonRecords(const json& records, const std::string& default_country,
                                       std::vector<Target>& targets) {
    size_t added = 0;
    for (const auto& record : records) {
        if (!record.is_object()) {
            LOG_WARNING("[CatalogLoader] Skipping non-object catalog record");
            continue;
        }

        std::string ip = first_string(record, {"ip_address", "ip"});
        std::string country = first_string(record, {"claimed_country_code", "country_code", "country"});
        if (country.empty()) {
            country = default_country;
        }
        std::string city = first_string(record, {"city"});

        if (add_record(ip, country, city, targets)) {
            added++;
        }
    }
    return added;
}

size_t CatalogLoader::parseCsv(std::istream& in, std::vector<Target>& targets) {
    std::string line;
    if (!std::getline(in, line)) {
        return 0;
    }

    std::vector<std::string> header = splitCsvLine(line);
    int ip_col = column_index(header, {"ip_address", "ip"});
    int country_col = column_index(header, {"country_code", "claimed_country_code", "country"});
    int city_col = column_index(header, {"city"});
    if (ip_col < 0 || country_col < 0) {
        return 0;
    }

    size_t added = 0;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) {
            continue;
        }

        std::vector<std::string> fields = splitCsvLine(line);
        auto field = [&fields](int col) {
            return (col >= 0 && static_cast<size_t>(col) < fields.size()) ? fields[col] : std::string();
        };

        if (add_record(field(ip_col), field(country_col), field(city_col), targets)) {
            added++;
        }
    }
    return added;
}

size_t CatalogLoader::collapseDuplicates(std::vector<Target>& targets) {
    std::unordered_set<std::string> seen;
    size_t before = targets.size();

    std::vector<Target> unique;
    unique.reserve(targets.size());
    for (auto& target : targets) {
        if (!seen.insert(target.ip_address).second) {
            LOG_WARNING("[CatalogLoader] Duplicate IP " + target.ip_address + " (" +
                        target.claimed_country_code + ") dropped");
            continue;
        }
        unique.push_back(std::move(target));
    }
    targets.swap(unique);

    return before - targets.size();
}

std::vector<std::string> CatalogLoader::splitCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    i++;
                } else {
                    in_quotes = false;
                }
            } else {
                current += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(current);
            current.clear();
        } else if (c != '\r') {
            current += c;
        }
    }
    fields.push_back(current);

    return fields;
}
