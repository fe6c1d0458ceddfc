#include "../include/FilterUtils.hpp"
#include <algorithm>
#include <cctype>

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c){ return std::tolower(c); });
    return result;
}

std::string to_upper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c){ return std::toupper(c); });
    return result;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
        start++;
    }
    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        end--;
    }
    return str.substr(start, end - start);
}

bool is_country_code(const std::string& code) {
    return code.size() == 2 &&
           std::isupper(static_cast<unsigned char>(code[0])) &&
           std::isupper(static_cast<unsigned char>(code[1]));
}

bool matches_filter(const Target& target, const CatalogFilters& filters) {
    if (!filters.countries.empty()) {
        bool match = false;
        for (const auto& country : filters.countries) {
            if (to_upper(trim(country)) == target.claimed_country_code) {
                match = true;
                break;
            }
        }
        if (!match) return false;
    }

    if (!filters.keyword.empty()) {
        std::string keyword = to_lower(filters.keyword);
        bool match = false;

        std::vector<std::string> fields = {target.ip_address, target.claimed_country_code, target.city};
        for (const auto& field : fields) {
            if (to_lower(field).find(keyword) != std::string::npos) {
                match = true;
                break;
            }
        }

        if (!match) return false;
    }

    return true;
}

std::vector<Target> filter_targets(const std::vector<Target>& targets, const CatalogFilters& filters) {
    std::vector<Target> filtered;
    for (const auto& target : targets) {
        if (matches_filter(target, filters)) {
            filtered.push_back(target);
        }
    }
    return filtered;
}
