#include "../include/CampaignRunner.hpp"
#include "../include/Logger.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <map>
#include <mutex>
#include <thread>
#include <unistd.h>

using ResolverBench::Shared::CountryStatsSerializer;
using ResolverBench::Shared::ProbeOutcome;

namespace {

// Fixed RTT per address; addresses without an entry never answer.
class TableProber : public Prober {
public:
    explicit TableProber(const std::map<std::string, double>& rtts,
                         std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : rtts_(rtts), delay_(delay) {}

    ProbeAttempt probe(const Target& target, int sequence, int) override {
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        auto it = rtts_.find(target.ip_address);
        if (it == rtts_.end()) {
            return ProbeAttempt::failure(target.ip_address, sequence, ProbeOutcome::TIMEOUT);
        }
        return ProbeAttempt::success(target.ip_address, sequence, it->second + sequence);
    }

private:
    std::map<std::string, double> rtts_;
    std::chrono::milliseconds delay_;
};

class TableGeoProvider : public GeoProvider {
public:
    explicit TableGeoProvider(const std::map<std::string, std::string>& countries)
        : countries_(countries) {}

    GeoLookupResult lookup(const std::string& ip) override {
        auto it = countries_.find(ip);
        if (it == countries_.end()) {
            return GeoLookupResult::failed(GeoLookupError::NOT_FOUND, "unknown");
        }
        return GeoLookupResult::found(it->second);
    }

private:
    std::map<std::string, std::string> countries_;
};

RunConfig test_config() {
    RunConfig config;
    config.probe.rounds = 3;
    config.probe.concurrency = 4;
    config.probe.timeout_ms = 50;
    config.lookup.concurrency = 2;
    return config;
}

const CountryStats* find_country(const std::vector<CountryStats>& stats, const std::string& code) {
    for (const auto& s : stats) {
        if (s.country_code == code) {
            return &s;
        }
    }
    return nullptr;
}

} // namespace

TEST(CampaignRunnerTest, CorrectedTargetCountsTowardResolvedCountry) {
    TableProber prober({{"1.1.1.1", 10.0}, {"5.5.5.5", 40.0}});
    TableGeoProvider provider({{"1.1.1.1", "US"}, {"5.5.5.5", "DE"}});
    RunDeadline deadline;
    CampaignRunner runner(test_config(), prober, &provider, deadline);

    CampaignResult result = runner.run({Target("1.1.1.1", "US"), Target("5.5.5.5", "FR"), Target("2.2.2.2", "US")});

    EXPECT_TRUE(result.reconciled);
    EXPECT_FALSE(result.truncated);
    ASSERT_EQ(result.countries.size(), 2u);
    EXPECT_EQ(find_country(result.countries, "FR"), nullptr);

    const CountryStats* de = find_country(result.countries, "DE");
    ASSERT_NE(de, nullptr);
    EXPECT_EQ(de->server_count, 1);
    EXPECT_DOUBLE_EQ(*de->min_ms, 40.0);
    EXPECT_DOUBLE_EQ(*de->median_ms, 41.0);
    EXPECT_DOUBLE_EQ(*de->max_ms, 42.0);

    const CountryStats* us = find_country(result.countries, "US");
    ASSERT_NE(us, nullptr);
    EXPECT_EQ(us->server_count, 1);
    EXPECT_EQ(us->unreachable_count, 1);
    EXPECT_DOUBLE_EQ(*us->avg_ms, 11.0);
}

TEST(CampaignRunnerTest, WithoutProviderClaimedCountriesStand) {
    TableProber prober({{"5.5.5.5", 40.0}});
    RunDeadline deadline;
    CampaignRunner runner(test_config(), prober, nullptr, deadline);

    CampaignResult result = runner.run({Target("5.5.5.5", "FR")});

    EXPECT_FALSE(result.reconciled);
    ASSERT_EQ(result.countries.size(), 1u);
    EXPECT_EQ(result.countries[0].country_code, "FR");
}

TEST(CampaignRunnerTest, ReportCountsTargets) {
    TableProber prober({{"1.1.1.1", 10.0}});
    TableGeoProvider provider(std::map<std::string, std::string>{{"1.1.1.1", "AU"}});
    RunDeadline deadline;
    CampaignRunner runner(test_config(), prober, &provider, deadline);

    CampaignResult result = runner.run({Target("1.1.1.1", "US"), Target("2.2.2.2", "US"), Target("bad", "US")});
    CampaignReport report = CampaignRunner::buildReport(result);

    EXPECT_EQ(report.total_targets, 3);
    EXPECT_EQ(report.reachable_targets, 1);
    EXPECT_EQ(report.unreachable_targets, 2);
    EXPECT_EQ(report.rejected_targets, 1);
    EXPECT_EQ(report.corrected_targets, 1);
    EXPECT_FALSE(report.timestamp.empty());
}

TEST(CampaignRunnerTest, WritesAllConfiguredReports) {
    std::string prefix = "/tmp/resolverbench_campaign_" + std::to_string(::getpid());
    RunConfig config = test_config();
    config.output.csv_file = prefix + ".csv";
    config.output.json_file = prefix + ".json";
    config.output.corrected_targets_file = prefix + "_targets.csv";

    TableProber prober({{"1.1.1.1", 10.0}});
    RunDeadline deadline;
    CampaignRunner runner(config, prober, nullptr, deadline);
    CampaignResult result = runner.run({Target("1.1.1.1", "US"), Target("2.2.2.2", "JP")});

    ASSERT_TRUE(runner.writeReports(result));

    std::ifstream csv(config.output.csv_file);
    std::string header;
    std::string first_row;
    ASSERT_TRUE(std::getline(csv, header));
    ASSERT_TRUE(std::getline(csv, first_row));
    EXPECT_EQ(first_row.substr(0, 3), "US\t");

    std::ifstream json_in(config.output.json_file);
    json report_json = json::parse(json_in);
    CampaignReport report = CountryStatsSerializer::deserializeReport(report_json);
    ASSERT_EQ(report.countries.size(), 2u);
    EXPECT_TRUE(report_json["countries"][0]["min_ms"].is_null());   // JP, sorted by code
    EXPECT_EQ(report.targets.size(), 2u);
    ASSERT_EQ(report.summaries.size(), 2u);
    EXPECT_EQ(report.summaries[0].target_ip, "1.1.1.1");
    EXPECT_EQ(report.summaries[0].samples.size(), 3u);
    EXPECT_TRUE(report.summaries[1].samples.empty());
    EXPECT_EQ(report_json["summaries"][1]["failed_count"], 3);

    EXPECT_TRUE(std::ifstream(config.output.corrected_targets_file).good());

    std::remove(config.output.csv_file.c_str());
    std::remove(config.output.json_file.c_str());
    std::remove(config.output.corrected_targets_file.c_str());
}

TEST(CampaignRunnerTest, Latin1CatalogTextStillWritesEveryReport) {
    std::string prefix = "/tmp/resolverbench_latin1_campaign_" + std::to_string(::getpid());
    RunConfig config = test_config();
    config.output.csv_file = prefix + ".csv";
    config.output.json_file = prefix + ".json";
    config.output.corrected_targets_file = prefix + "_targets.csv";

    Logger::getInstance().setLogLevel(LogLevel::DEBUG);
    TableProber prober({{"9.9.9.9", 3.0}});
    RunDeadline deadline;
    CampaignRunner runner(config, prober, nullptr, deadline);
    CampaignResult result = runner.run({Target("9.9.9.9", "CH", "Z\xFCrich"), Target("\xFC.1.1.1", "CH")});
    bool written = runner.writeReports(result);
    Logger::getInstance().setLogLevel(LogLevel::INFO);

    EXPECT_TRUE(written);
    EXPECT_TRUE(std::ifstream(config.output.csv_file).good());
    EXPECT_TRUE(std::ifstream(config.output.json_file).good());
    EXPECT_TRUE(std::ifstream(config.output.corrected_targets_file).good());
    EXPECT_FALSE(std::ifstream(config.output.json_file + ".tmp").good());

    std::remove(config.output.csv_file.c_str());
    std::remove(config.output.json_file.c_str());
    std::remove(config.output.corrected_targets_file.c_str());
}

TEST(CampaignRunnerTest, BudgetExpiringMidRunKeepsPartialSamples) {
    RunConfig config = test_config();
    config.probe.concurrency = 1;

    TableProber prober({{"1.1.1.1", 10.0}, {"1.0.0.1", 20.0}, {"8.8.8.8", 30.0}, {"8.8.4.4", 40.0}},
                       std::chrono::milliseconds(30));
    RunDeadline deadline;
    CampaignRunner runner(config, prober, nullptr, deadline);

    deadline.setBudget(std::chrono::milliseconds(100));
    CampaignResult result = runner.run({Target("1.1.1.1", "US"), Target("1.0.0.1", "US"),
                                        Target("8.8.8.8", "US"), Target("8.8.4.4", "US")});

    EXPECT_TRUE(result.truncated);
    EXPECT_TRUE(CampaignRunner::buildReport(result).truncated);

    int partial = 0;
    int reachable = 0;
    for (const auto& summary : result.summaries) {
        EXPECT_LT(summary.attempted_count, config.probe.rounds);
        if (summary.attempted_count > 0) {
            partial++;
        }
        if (summary.isReachable()) {
            reachable++;
        }
    }
    EXPECT_GT(partial, 0);
    EXPECT_GE(result.summaries[0].attempted_count, 1);

    ASSERT_EQ(result.countries.size(), 1u);
    const CountryStats& us = result.countries[0];
    EXPECT_EQ(us.server_count, reachable);
    EXPECT_EQ(us.server_count + us.unreachable_count, 4);
    ASSERT_TRUE(us.min_ms.has_value());
    EXPECT_DOUBLE_EQ(*us.min_ms, 10.0);
}

TEST(CampaignRunnerTest, CancelledRunIsTruncated) {
    TableProber prober({{"1.1.1.1", 10.0}});
    RunDeadline deadline;
    deadline.cancel();
    CampaignRunner runner(test_config(), prober, nullptr, deadline);

    CampaignResult result = runner.run({Target("1.1.1.1", "US")});

    EXPECT_TRUE(result.truncated);
    ASSERT_EQ(result.countries.size(), 1u);
    EXPECT_EQ(result.countries[0].server_count, 0);
    EXPECT_EQ(result.countries[0].unreachable_count, 1);
}
