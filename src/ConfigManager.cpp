#include "../include/ConfigManager.hpp"
#include "../include/Logger.hpp"
#include <cstdlib>
#include <fstream>

using namespace ResolverBench::Shared;

ConfigManager::ConfigManager() : config_loaded_(false) {
}

ConfigManager::~ConfigManager() {
}

bool ConfigManager::loadPackageConfig(const std::string& config_file_path) {
    std::ifstream file(config_file_path);
    if (!file.is_open()) {
        LOG_ERROR("[ConfigManager] Could not open config file: " + config_file_path);
        return false;
    }

    json parsed;
    try {
        file >> parsed;
    } catch (const std::exception& e) {
        LOG_ERROR("[ConfigManager] Error parsing JSON: " + std::string(e.what()));
        return false;
    }

    if (!loadFromJson(parsed)) {
        return false;
    }

    LOG_INFO("[ConfigManager] Successfully loaded config from: " + config_file_path);
    return true;
}

bool ConfigManager::loadFromJson(const json& package_config) {
    if (!package_config.is_object()) {
        LOG_ERROR("[ConfigManager] Config root must be a JSON object");
        return false;
    }

    try {
        run_config_ = RunConfigSerializer::deserializeRunConfig(package_config);
    } catch (const json::exception& e) {
        LOG_ERROR("[ConfigManager] Invalid value in config: " + std::string(e.what()));
        return false;
    }

    applyEnvironmentOverrides();
    config_loaded_ = true;
    return true;
}

void ConfigManager::applyEnvironmentOverrides() {
    if (run_config_.lookup.token.empty()) {
        const char* token = std::getenv("IPINFO_TOKEN");
        if (token != nullptr) {
            run_config_.lookup.token = token;
        }
    }
}

const RunConfig& ConfigManager::getRunConfig() const {
    return run_config_;
}

bool ConfigManager::validateConfig() const {
    validation_errors_.clear();

    if (!config_loaded_) {
        validation_errors_.push_back("no configuration loaded");
    } else {
        const RunConfig& c = run_config_;

        if (c.catalog.path.empty()) {
            validation_errors_.push_back("'catalog.path' is required");
        }
        if (c.catalog.format == CatalogFormat::UNKNOWN) {
            validation_errors_.push_back("'catalog.format' must be one of json, csv, country-dir");
        }
        if (c.probe.rounds < 1) {
            validation_errors_.push_back("'probe.rounds' must be at least 1");
        }
        if (c.probe.timeout_ms <= 0) {
            validation_errors_.push_back("'probe.timeout_ms' must be positive");
        }
        if (c.probe.concurrency <= 0) {
            validation_errors_.push_back("'probe.concurrency' must be positive");
        }
        if (c.probe.packet_size < 0 || c.probe.packet_size > 65000) {
            validation_errors_.push_back("'probe.packet_size' must be within [0, 65000]");
        }
        if (c.probe.ttl < 1 || c.probe.ttl > 255) {
            validation_errors_.push_back("'probe.ttl' must be within [1, 255]");
        }
        if (c.probe.socket_type == SocketType::UNKNOWN) {
            validation_errors_.push_back("'probe.socket_type' must be raw or dgram");
        }
        if (c.lookup.enabled) {
            if (c.lookup.base_url.empty()) {
                validation_errors_.push_back("'lookup.base_url' is required when lookups are enabled");
            }
            if (c.lookup.timeout_ms <= 0) {
                validation_errors_.push_back("'lookup.timeout_ms' must be positive");
            }
            if (c.lookup.concurrency <= 0) {
                validation_errors_.push_back("'lookup.concurrency' must be positive");
            }
            if (c.lookup.min_interval_ms < 0) {
                validation_errors_.push_back("'lookup.min_interval_ms' must not be negative");
            }
            if (c.lookup.max_lookups < 0) {
                validation_errors_.push_back("'lookup.max_lookups' must not be negative");
            }
        }
        if (c.run_deadline_sec < 0) {
            validation_errors_.push_back("'run_deadline_sec' must not be negative");
        }
        if (c.output.csv_delimiter.empty()) {
            validation_errors_.push_back("'output.csv_delimiter' must not be empty");
        }
        if (c.output.decimal_comma && c.output.csv_delimiter == ",") {
            validation_errors_.push_back("'output.decimal_comma' needs a delimiter other than ','");
        }
    }

    for (const auto& error : validation_errors_) {
        LOG_ERROR("[ConfigManager] " + error);
    }
    return validation_errors_.empty();
}

const std::vector<std::string>& ConfigManager::getValidationErrors() const {
    return validation_errors_;
}
