#include "../include/CLIUtils.hpp"
#include "../include/RunDeadline.hpp"
#include <atomic>
#include <iostream>
#include <signal.h>
#include <unistd.h>

namespace {

std::atomic<RunDeadline*> g_deadline(nullptr);

void signal_handler(int signum) {
    if (signum == SIGINT) {
        static const char msg[] = "\n[Signal] Caught Ctrl+C (SIGINT), finishing in-flight probes...\n";
        ssize_t written = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)written;

        RunDeadline* deadline = g_deadline.load();
        if (deadline != nullptr) {
            deadline->cancel();
        }
    }
}

} // namespace

void setup_signal_handlers(RunDeadline* deadline) {
    g_deadline.store(deadline);

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    if (sigaction(SIGINT, &sa, nullptr) == -1) {
        std::cerr << "Warning: Failed to setup SIGINT handler" << std::endl;
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Measures ICMP round-trip latency to a catalog of DNS resolvers and\n"
              << "reports min / median / average / max per country.\n\n"
              << "Options:\n"
              << "  -package_config FILE    Run configuration file\n"
              << "  -h, --help              Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " -package_config config.json\n\n"
              << "Configuration file format:\n"
              << "{\n"
              << "  \"catalog\": { \"path\": \"resolvers.json\", \"format\": \"json\" },\n"
              << "  \"filters\": { \"countries\": [\"DE\", \"FR\"], \"keyword\": \"\" },\n"
              << "  \"probe\": {\n"
              << "    \"rounds\": 10,\n"
              << "    \"timeout_ms\": 500,\n"
              << "    \"concurrency\": 64,\n"
              << "    \"packet_size\": 56,\n"
              << "    \"ttl\": 64,\n"
              << "    \"socket_type\": \"raw\"\n"
              << "  },\n"
              << "  \"lookup\": {\n"
              << "    \"enabled\": true,\n"
              << "    \"base_url\": \"https://ipinfo.io\",\n"
              << "    \"token\": \"\",\n"
              << "    \"timeout_ms\": 15000,\n"
              << "    \"concurrency\": 4,\n"
              << "    \"min_interval_ms\": 0,\n"
              << "    \"max_lookups\": 0\n"
              << "  },\n"
              << "  \"run_deadline_sec\": 0,\n"
              << "  \"output\": {\n"
              << "    \"csv_file\": \"rtt_result.csv\",\n"
              << "    \"json_file\": \"\",\n"
              << "    \"corrected_targets_file\": \"\",\n"
              << "    \"csv_delimiter\": \"\\t\",\n"
              << "    \"decimal_comma\": true\n"
              << "  },\n"
              << "  \"log_file\": \"\",\n"
              << "  \"log_level\": \"INFO\"\n"
              << "}\n\n"
              << "Catalog formats: json, csv, country-dir\n"
              << "Socket types: raw (needs CAP_NET_RAW), dgram (unprivileged ICMP sockets)\n"
              << "The IPINFO_TOKEN environment variable is used when no token is configured.\n"
              << std::endl;
}
