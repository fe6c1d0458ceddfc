#ifndef CATALOG_LOADER_HPP
#define CATALOG_LOADER_HPP

#include "../ur-resolverbench-shared/include/RunConfigSerializer.hpp"
#include "../ur-resolverbench-shared/include/TargetSerializer.hpp"
#include <istream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;
using ResolverBench::Shared::CatalogConfig;
using ResolverBench::Shared::Target;

/**
 * @brief Reads resolver catalogs into Target records.
 *
 * Supported layouts:
 *  - json:        [{"ip_address": "...", "claimed_country_code": "DE", "city": "..."}]
 *                 ("ip", "country_code" and "country" are accepted as aliases)
 *  - csv:         header row naming ip_address and country_code columns
 *  - country-dir: one <cc>.json file per country holding [{"ip": "...", "city": "..."}]
 *
 * Country codes are normalized to upper case. Records without an IP or with
 * a country code that is not two letters are skipped. Repeated IPs keep the
 * first record.
 */
class CatalogLoader {
public:
    static bool load(const CatalogConfig& config, std::vector<Target>& targets);

    static bool loadJsonFile(const std::string& path, std::vector<Target>& targets);
    static bool loadCsvFile(const std::string& path, std::vector<Target>& targets);
    static bool loadCountryDirectory(const std::string& dir, std::vector<Target>& targets);

    // An empty default_country means every record must carry its own.
    static size_t parseJsonRecords(const json& records, const std::string& default_country,
                                   std::vector<Target>& targets);
    static size_t parseCsv(std::istream& in, std::vector<Target>& targets);

    // Returns the number of records dropped.
    static size_t collapseDuplicates(std::vector<Target>& targets);

    static std::vector<std::string> splitCsvLine(const std::string& line);
};

#endif // CATALOG_LOADER_HPP
