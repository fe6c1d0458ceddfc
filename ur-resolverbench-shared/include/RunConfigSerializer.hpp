#ifndef RUN_CONFIG_SERIALIZER_HPP
#define RUN_CONFIG_SERIALIZER_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace ResolverBench {
namespace Shared {

enum class CatalogFormat {
    JSON,
    CSV,
    COUNTRY_DIR,
    UNKNOWN
};

enum class SocketType {
    RAW,
    DGRAM,
    UNKNOWN
};

struct CatalogFilters {
    std::vector<std::string> countries;
    std::string keyword;
};

struct CatalogConfig {
    std::string path;
    CatalogFormat format;

    CatalogConfig() : format(CatalogFormat::JSON) {}
};

struct ProbeConfig {
    int rounds;
    int timeout_ms;
    int concurrency;
    int packet_size;
    int ttl;
    SocketType socket_type;

    ProbeConfig()
        : rounds(10),
          timeout_ms(500),
          concurrency(64),
          packet_size(56),
          ttl(64),
          socket_type(SocketType::RAW) {}
};

struct LookupConfig {
    bool enabled;
    std::string base_url;
    std::string token;
    int timeout_ms;
    int concurrency;
    int min_interval_ms;
    int max_lookups;   // 0 = unlimited

    LookupConfig()
        : enabled(true),
          base_url("https://ipinfo.io"),
          timeout_ms(15000),
          concurrency(4),
          min_interval_ms(0),
          max_lookups(0) {}
};

struct OutputConfig {
    std::string csv_file;
    std::string json_file;
    std::string corrected_targets_file;
    std::string csv_delimiter;
    bool decimal_comma;

    OutputConfig()
        : csv_file("rtt_result.csv"),
          csv_delimiter("\t"),
          decimal_comma(true) {}
};

struct RunConfig {
    CatalogConfig catalog;
    CatalogFilters filters;
    ProbeConfig probe;
    LookupConfig lookup;
    OutputConfig output;
    int run_deadline_sec;   // 0 = no deadline
    std::string log_file;
    std::string log_level;

    RunConfig()
        : run_deadline_sec(0),
          log_level("INFO") {}
};

class RunConfigSerializer {
public:
    static std::string catalogFormatToString(CatalogFormat format);
    static CatalogFormat stringToCatalogFormat(const std::string& format_str);

    static std::string socketTypeToString(SocketType type);
    static SocketType stringToSocketType(const std::string& type_str);

    static json serializeRunConfig(const RunConfig& config);
    static RunConfig deserializeRunConfig(const json& j);
};

} // namespace Shared
} // namespace ResolverBench

#endif // RUN_CONFIG_SERIALIZER_HPP
