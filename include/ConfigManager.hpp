#ifndef CONFIG_MANAGER_HPP
#define CONFIG_MANAGER_HPP

#include "../ur-resolverbench-shared/include/RunConfigSerializer.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;
using ResolverBench::Shared::RunConfig;

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Load package configuration from file
    bool loadPackageConfig(const std::string& config_file_path);

    // Load from an already parsed document
    bool loadFromJson(const json& package_config);

    const RunConfig& getRunConfig() const;

    // Every violated constraint is collected; any violation is fatal for the run.
    bool validateConfig() const;
    const std::vector<std::string>& getValidationErrors() const;

private:
    RunConfig run_config_;
    bool config_loaded_;
    mutable std::vector<std::string> validation_errors_;

    void applyEnvironmentOverrides();
};

#endif // CONFIG_MANAGER_HPP
