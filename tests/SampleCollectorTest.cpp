#include "../include/SampleCollector.hpp"
#include "../include/CountryAggregator.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <random>

using ResolverBench::Shared::ProbeOutcome;

namespace {

std::vector<ProbeAttempt> mixed_attempts() {
    return {
        ProbeAttempt::success("1.1.1.1", 0, 12.5),
        ProbeAttempt::failure("1.1.1.1", 1, ProbeOutcome::TIMEOUT),
        ProbeAttempt::success("1.1.1.1", 2, 9.0),
        ProbeAttempt::failure("1.1.1.1", 3, ProbeOutcome::UNREACHABLE),
        ProbeAttempt::success("8.8.8.8", 0, 30.0),
        ProbeAttempt::success("8.8.8.8", 1, 31.0),
        ProbeAttempt::failure("8.8.8.8", 2, ProbeOutcome::ERROR, "sendto failed"),
        ProbeAttempt::success("8.8.8.8", 3, 29.5),
        ProbeAttempt::failure("9.9.9.9", 0, ProbeOutcome::TIMEOUT),
        ProbeAttempt::failure("9.9.9.9", 1, ProbeOutcome::TIMEOUT),
        ProbeAttempt::failure("9.9.9.9", 2, ProbeOutcome::TIMEOUT),
        ProbeAttempt::failure("9.9.9.9", 3, ProbeOutcome::TIMEOUT),
    };
}

std::vector<Target> catalog() {
    return {Target("1.1.1.1", "US"), Target("8.8.8.8", "US"), Target("9.9.9.9", "CH")};
}

std::vector<TargetSummary> collect(const std::vector<ProbeAttempt>& attempts) {
    SampleCollector collector(catalog());
    for (const auto& attempt : attempts) {
        EXPECT_TRUE(collector.record(attempt));
    }
    return collector.summarize();
}

} // namespace

TEST(SampleCollectorTest, SummaryCountsSuccessesAndFailures) {
    std::vector<TargetSummary> summaries = collect(mixed_attempts());
    ASSERT_EQ(summaries.size(), 3u);

    EXPECT_EQ(summaries[0].target_ip, "1.1.1.1");
    EXPECT_EQ(summaries[0].effective_country_code, "US");
    EXPECT_EQ(summaries[0].attempted_count, 4);
    EXPECT_EQ(summaries[0].failed_count, 2);
    EXPECT_EQ(summaries[0].samples, (std::vector<double>{12.5, 9.0}));

    EXPECT_EQ(summaries[1].samples, (std::vector<double>{30.0, 31.0, 29.5}));
    EXPECT_EQ(summaries[1].failed_count, 1);

    for (const auto& summary : summaries) {
        EXPECT_EQ(summary.samples.size() + static_cast<size_t>(summary.failed_count),
                  static_cast<size_t>(summary.attempted_count));
    }
}

TEST(SampleCollectorTest, AllFailedTargetHasNoSamples) {
    std::vector<TargetSummary> summaries = collect(mixed_attempts());
    const TargetSummary& dead = summaries[2];

    EXPECT_EQ(dead.target_ip, "9.9.9.9");
    EXPECT_TRUE(dead.samples.empty());
    EXPECT_FALSE(dead.isReachable());
    EXPECT_EQ(dead.failed_count, dead.attempted_count);
}

TEST(SampleCollectorTest, ArrivalOrderDoesNotChangeSummariesOrStats) {
    std::vector<ProbeAttempt> attempts = mixed_attempts();
    std::vector<TargetSummary> reference = collect(attempts);
    std::vector<CountryStats> reference_stats = CountryAggregator::aggregate(reference);

    std::mt19937 rng(42);
    for (int i = 0; i < 20; i++) {
        std::shuffle(attempts.begin(), attempts.end(), rng);
        std::vector<TargetSummary> shuffled = collect(attempts);

        ASSERT_EQ(shuffled.size(), reference.size());
        for (size_t t = 0; t < reference.size(); t++) {
            EXPECT_EQ(shuffled[t].target_ip, reference[t].target_ip);
            EXPECT_EQ(shuffled[t].samples, reference[t].samples);
            EXPECT_EQ(shuffled[t].attempted_count, reference[t].attempted_count);
            EXPECT_EQ(shuffled[t].failed_count, reference[t].failed_count);
        }

        std::vector<CountryStats> stats = CountryAggregator::aggregate(shuffled);
        ASSERT_EQ(stats.size(), reference_stats.size());
        for (size_t c = 0; c < stats.size(); c++) {
            EXPECT_EQ(stats[c].country_code, reference_stats[c].country_code);
            EXPECT_EQ(stats[c].min_ms, reference_stats[c].min_ms);
            EXPECT_EQ(stats[c].avg_ms, reference_stats[c].avg_ms);
            EXPECT_EQ(stats[c].median_ms, reference_stats[c].median_ms);
            EXPECT_EQ(stats[c].max_ms, reference_stats[c].max_ms);
            EXPECT_EQ(stats[c].server_count, reference_stats[c].server_count);
            EXPECT_EQ(stats[c].unreachable_count, reference_stats[c].unreachable_count);
        }
    }
}

TEST(SampleCollectorTest, RejectsUnknownTargetAndRepeatedSequence) {
    SampleCollector collector(catalog());

    EXPECT_FALSE(collector.record(ProbeAttempt::success("4.4.4.4", 0, 1.0)));
    EXPECT_TRUE(collector.record(ProbeAttempt::success("1.1.1.1", 0, 1.0)));
    EXPECT_FALSE(collector.record(ProbeAttempt::success("1.1.1.1", 0, 2.0)));

    std::vector<TargetSummary> summaries = collector.summarize();
    EXPECT_EQ(summaries[0].attempted_count, 1);
    EXPECT_EQ(summaries[0].samples, (std::vector<double>{1.0}));
}

TEST(SampleCollectorTest, UsesCorrectedCountry) {
    Target moved("5.5.5.5", "FR");
    moved.resolved_country_code = std::string("DE");

    SampleCollector collector({moved});
    ASSERT_TRUE(collector.record(ProbeAttempt::success("5.5.5.5", 0, 15.0)));

    std::vector<TargetSummary> summaries = collector.summarize();
    ASSERT_EQ(summaries.size(), 1u);
    EXPECT_EQ(summaries[0].effective_country_code, "DE");
}

TEST(SampleCollectorTest, RejectedFlagPropagates) {
    SampleCollector collector({Target("not-an-ip", "US")});
    ProbeAttempt attempt = ProbeAttempt::failure("not-an-ip", 0, ProbeOutcome::ERROR, "Invalid IP address");
    attempt.rejected = true;
    ASSERT_TRUE(collector.record(attempt));

    std::vector<TargetSummary> summaries = collector.summarize();
    EXPECT_TRUE(summaries[0].rejected);
    EXPECT_EQ(summaries[0].failed_count, 1);
}

TEST(SampleCollectorTest, TargetWithoutAttemptsIsEmpty) {
    SampleCollector collector(catalog());
    std::vector<TargetSummary> summaries = collector.summarize();

    ASSERT_EQ(summaries.size(), 3u);
    for (const auto& summary : summaries) {
        EXPECT_EQ(summary.attempted_count, 0);
        EXPECT_TRUE(summary.samples.empty());
    }
}

TEST(SampleCollectorTest, ReplaysLoggedAttempts) {
    json log = json::parse(R"([
        {"target_ip": "1.1.1.1", "sequence_number": 1, "outcome": "TIMEOUT", "rtt_ms": 0.0},
        {"target_ip": "1.1.1.1", "sequence_number": 0, "outcome": "SUCCESS", "rtt_ms": 4.5},
        {"target_ip": "9.9.9.9", "sequence_number": 0, "outcome": "UNREACHABLE", "error_message": "ICMP error type 3"}
    ])");

    SampleCollector collector(catalog());
    for (const auto& entry : log) {
        ASSERT_TRUE(collector.record(ResolverBench::Shared::ProbeAttemptSerializer::deserializeAttempt(entry)));
    }

    std::vector<TargetSummary> summaries = collector.summarize();
    EXPECT_EQ(summaries[0].samples, (std::vector<double>{4.5}));
    EXPECT_EQ(summaries[0].failed_count, 1);
    EXPECT_EQ(summaries[2].failed_count, 1);
    EXPECT_FALSE(summaries[2].isReachable());
}
