#include "../include/CLIUtils.hpp"
#include "../include/CampaignRunner.hpp"
#include "../include/ConfigManager.hpp"
#include "../include/Logger.hpp"
#include "../include/RunDeadline.hpp"
#include <curl/curl.h>
#include <exception>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    std::string package_config_file;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-package_config") {
            if (i + 1 < argc) {
                package_config_file = argv[++i];
            } else {
                std::cerr << "Error: -package_config requires a file path\n";
                print_usage(argv[0]);
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (package_config_file.empty()) {
        std::cerr << "Error: -package_config is required\n\n";
        print_usage(argv[0]);
        return 1;
    }

    ConfigManager config_manager;
    if (!config_manager.loadPackageConfig(package_config_file)) {
        return 1;
    }
    if (!config_manager.validateConfig()) {
        return 1;
    }

    const RunConfig& config = config_manager.getRunConfig();

    Logger& logger = Logger::getInstance();
    logger.setLogLevel(Logger::levelFromString(config.log_level));
    if (!config.log_file.empty() && !logger.setLogFile(config.log_file)) {
        std::cerr << "Warning: Could not open log file " << config.log_file << std::endl;
    }

    LOG_INFO("========================================");
    LOG_INFO("Resolver Latency Benchmark");
    LOG_INFO("========================================");
    LOG_INFO("Package Config: " + package_config_file);
    LOG_INFO("Catalog: " + config.catalog.path);
    LOG_INFO("Rounds: " + std::to_string(config.probe.rounds) +
             ", timeout: " + std::to_string(config.probe.timeout_ms) + "ms" +
             ", concurrency: " + std::to_string(config.probe.concurrency));
    LOG_INFO("========================================");

    json effective = ResolverBench::Shared::RunConfigSerializer::serializeRunConfig(config);
    if (!config.lookup.token.empty()) {
        effective["lookup"]["token"] = "***";
    }
    LOG_DEBUG("Effective config: " + effective.dump(-1, ' ', false, json::error_handler_t::replace));

    RunDeadline deadline;
    setup_signal_handlers(&deadline);

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        LOG_ERROR("Failed to initialize libcurl");
        return 1;
    }

    int exit_code = 1;
    try {
        exit_code = CampaignRunner::execute(config, deadline);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Campaign failed: ") + e.what());
        exit_code = 1;
    }

    setup_signal_handlers(nullptr);
    curl_global_cleanup();

    return exit_code;
}
