#include "../include/RunConfigSerializer.hpp"

namespace ResolverBench {
namespace Shared {

std::string RunConfigSerializer::catalogFormatToString(CatalogFormat format) {
    switch (format) {
        case CatalogFormat::JSON:
            return "json";
        case CatalogFormat::CSV:
            return "csv";
        case CatalogFormat::COUNTRY_DIR:
            return "country-dir";
        default:
            return "unknown";
    }
}

CatalogFormat RunConfigSerializer::stringToCatalogFormat(const std::string& format_str) {
    if (format_str == "json") return CatalogFormat::JSON;
    if (format_str == "csv") return CatalogFormat::CSV;
    if (format_str == "country-dir") return CatalogFormat::COUNTRY_DIR;
    return CatalogFormat::UNKNOWN;
}

std::string RunConfigSerializer::socketTypeToString(SocketType type) {
    switch (type) {
        case SocketType::RAW:
            return "raw";
        case SocketType::DGRAM:
            return "dgram";
        default:
            return "unknown";
    }
}

SocketType RunConfigSerializer::stringToSocketType(const std::string& type_str) {
    if (type_str == "raw") return SocketType::RAW;
    if (type_str == "dgram") return SocketType::DGRAM;
    return SocketType::UNKNOWN;
}

json RunConfigSerializer::serializeRunConfig(const RunConfig& config) {
    json j;
    j["catalog"] = {
        {"path", config.catalog.path},
        {"format", catalogFormatToString(config.catalog.format)}
    };
    j["filters"] = {
        {"countries", config.filters.countries},
        {"keyword", config.filters.keyword}
    };
    j["probe"] = {
        {"rounds", config.probe.rounds},
        {"timeout_ms", config.probe.timeout_ms},
        {"concurrency", config.probe.concurrency},
        {"packet_size", config.probe.packet_size},
        {"ttl", config.probe.ttl},
        {"socket_type", socketTypeToString(config.probe.socket_type)}
    };
    j["lookup"] = {
        {"enabled", config.lookup.enabled},
        {"base_url", config.lookup.base_url},
        {"token", config.lookup.token},
        {"timeout_ms", config.lookup.timeout_ms},
        {"concurrency", config.lookup.concurrency},
        {"min_interval_ms", config.lookup.min_interval_ms},
        {"max_lookups", config.lookup.max_lookups}
    };
    j["output"] = {
        {"csv_file", config.output.csv_file},
        {"json_file", config.output.json_file},
        {"corrected_targets_file", config.output.corrected_targets_file},
        {"csv_delimiter", config.output.csv_delimiter},
        {"decimal_comma", config.output.decimal_comma}
    };
    j["run_deadline_sec"] = config.run_deadline_sec;
    j["log_file"] = config.log_file;
    j["log_level"] = config.log_level;
    return j;
}

// Missing keys keep the defaults from the struct constructors.
RunConfig RunConfigSerializer::deserializeRunConfig(const json& j) {
    RunConfig config;

    if (j.contains("catalog") && j["catalog"].is_object()) {
        const json& c = j["catalog"];
        config.catalog.path = c.value("path", config.catalog.path);
        config.catalog.format = stringToCatalogFormat(
            c.value("format", catalogFormatToString(config.catalog.format)));
    }

    if (j.contains("filters") && j["filters"].is_object()) {
        const json& f = j["filters"];
        if (f.contains("countries") && f["countries"].is_array()) {
            config.filters.countries = f["countries"].get<std::vector<std::string>>();
        }
        config.filters.keyword = f.value("keyword", "");
    }

    if (j.contains("probe") && j["probe"].is_object()) {
        const json& p = j["probe"];
        config.probe.rounds = p.value("rounds", config.probe.rounds);
        config.probe.timeout_ms = p.value("timeout_ms", config.probe.timeout_ms);
        config.probe.concurrency = p.value("concurrency", config.probe.concurrency);
        config.probe.packet_size = p.value("packet_size", config.probe.packet_size);
        config.probe.ttl = p.value("ttl", config.probe.ttl);
        config.probe.socket_type = stringToSocketType(
            p.value("socket_type", socketTypeToString(config.probe.socket_type)));
    }

    if (j.contains("lookup") && j["lookup"].is_object()) {
        const json& l = j["lookup"];
        config.lookup.enabled = l.value("enabled", config.lookup.enabled);
        config.lookup.base_url = l.value("base_url", config.lookup.base_url);
        config.lookup.token = l.value("token", config.lookup.token);
        config.lookup.timeout_ms = l.value("timeout_ms", config.lookup.timeout_ms);
        config.lookup.concurrency = l.value("concurrency", config.lookup.concurrency);
        config.lookup.min_interval_ms = l.value("min_interval_ms", config.lookup.min_interval_ms);
        config.lookup.max_lookups = l.value("max_lookups", config.lookup.max_lookups);
    }

    if (j.contains("output") && j["output"].is_object()) {
        const json& o = j["output"];
        config.output.csv_file = o.value("csv_file", config.output.csv_file);
        config.output.json_file = o.value("json_file", config.output.json_file);
        config.output.corrected_targets_file =
            o.value("corrected_targets_file", config.output.corrected_targets_file);
        config.output.csv_delimiter = o.value("csv_delimiter", config.output.csv_delimiter);
        config.output.decimal_comma = o.value("decimal_comma", config.output.decimal_comma);
    }

    config.run_deadline_sec = j.value("run_deadline_sec", config.run_deadline_sec);
    config.log_file = j.value("log_file", config.log_file);
    config.log_level = j.value("log_level", config.log_level);

    return config;
}

} // namespace Shared
} // namespace ResolverBench
