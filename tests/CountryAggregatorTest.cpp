#include "../include/CountryAggregator.hpp"
#include <gtest/gtest.h>

namespace {

TargetSummary summary(const std::string& ip, const std::string& country,
                      const std::vector<double>& samples, int attempted) {
    TargetSummary s;
    s.target_ip = ip;
    s.effective_country_code = country;
    s.samples = samples;
    s.attempted_count = attempted;
    s.failed_count = attempted - static_cast<int>(samples.size());
    return s;
}

} // namespace

TEST(CountryAggregatorTest, MedianOddAndEven) {
    EXPECT_DOUBLE_EQ(CountryAggregator::median({1.0, 2.0, 9.0}), 2.0);
    EXPECT_DOUBLE_EQ(CountryAggregator::median({1.0, 2.0, 4.0, 9.0}), 3.0);
    EXPECT_DOUBLE_EQ(CountryAggregator::median({10.0, 20.0}), 15.0);
    EXPECT_DOUBLE_EQ(CountryAggregator::median({7.0}), 7.0);
}

TEST(CountryAggregatorTest, SingleServerAllRoundsAnswered) {
    std::vector<CountryStats> stats =
        CountryAggregator::aggregate({summary("1.1.1.1", "US", {10.0, 20.0, 30.0}, 3)});

    ASSERT_EQ(stats.size(), 1u);
    const CountryStats& us = stats[0];
    EXPECT_EQ(us.country_code, "US");
    EXPECT_DOUBLE_EQ(*us.min_ms, 10.0);
    EXPECT_DOUBLE_EQ(*us.avg_ms, 20.0);
    EXPECT_DOUBLE_EQ(*us.median_ms, 20.0);
    EXPECT_DOUBLE_EQ(*us.max_ms, 30.0);
    EXPECT_EQ(us.server_count, 1);
    EXPECT_EQ(us.unreachable_count, 0);
}

TEST(CountryAggregatorTest, UnreachableCountryKeptWithoutFigures) {
    std::vector<CountryStats> stats =
        CountryAggregator::aggregate({summary("2.2.2.2", "US", {}, 3)});

    ASSERT_EQ(stats.size(), 1u);
    const CountryStats& us = stats[0];
    EXPECT_EQ(us.server_count, 0);
    EXPECT_EQ(us.unreachable_count, 1);
    EXPECT_FALSE(us.min_ms.has_value());
    EXPECT_FALSE(us.avg_ms.has_value());
    EXPECT_FALSE(us.median_ms.has_value());
    EXPECT_FALSE(us.max_ms.has_value());
}

TEST(CountryAggregatorTest, StatisticsUseUnionOfSamples) {
    // Mean of per-server medians would be (2 + 100) / 2 = 51; the union median is 3.
    std::vector<CountryStats> stats = CountryAggregator::aggregate({
        summary("1.1.1.1", "DE", {1.0, 2.0, 3.0}, 3),
        summary("1.0.0.1", "DE", {100.0}, 3),
        summary("9.9.9.9", "DE", {}, 3),
    });

    ASSERT_EQ(stats.size(), 1u);
    const CountryStats& de = stats[0];
    EXPECT_DOUBLE_EQ(*de.min_ms, 1.0);
    EXPECT_DOUBLE_EQ(*de.max_ms, 100.0);
    EXPECT_DOUBLE_EQ(*de.median_ms, 2.5);
    EXPECT_DOUBLE_EQ(*de.avg_ms, 106.0 / 4.0);
    EXPECT_EQ(de.server_count, 2);
    EXPECT_EQ(de.unreachable_count, 1);
    EXPECT_LE(*de.min_ms, *de.median_ms);
    EXPECT_LE(*de.median_ms, *de.max_ms);
}

TEST(CountryAggregatorTest, GroupsByCountryInCodeOrder) {
    std::vector<CountryStats> stats = CountryAggregator::aggregate({
        summary("3.3.3.3", "US", {5.0}, 1),
        summary("4.4.4.4", "CH", {8.0}, 1),
        summary("5.5.5.5", "DE", {}, 1),
    });

    ASSERT_EQ(stats.size(), 3u);
    EXPECT_EQ(stats[0].country_code, "CH");
    EXPECT_EQ(stats[1].country_code, "DE");
    EXPECT_EQ(stats[2].country_code, "US");
}

TEST(CountryAggregatorTest, InputOrderAndRepetitionGiveSameResult) {
    std::vector<TargetSummary> input = {
        summary("1.1.1.1", "US", {10.0, 30.0}, 2),
        summary("8.8.8.8", "US", {20.0, 0.5}, 2),
        summary("9.9.9.9", "CH", {7.25}, 2),
    };
    std::vector<TargetSummary> reversed(input.rbegin(), input.rend());

    std::vector<CountryStats> first = CountryAggregator::aggregate(input);
    std::vector<CountryStats> second = CountryAggregator::aggregate(input);
    std::vector<CountryStats> third = CountryAggregator::aggregate(reversed);

    ASSERT_EQ(first.size(), 2u);
    ASSERT_EQ(third.size(), 2u);
    for (size_t i = 0; i < first.size(); i++) {
        EXPECT_EQ(first[i].country_code, second[i].country_code);
        EXPECT_EQ(first[i].avg_ms, second[i].avg_ms);
        EXPECT_EQ(first[i].country_code, third[i].country_code);
        EXPECT_EQ(first[i].min_ms, third[i].min_ms);
        EXPECT_EQ(first[i].avg_ms, third[i].avg_ms);
        EXPECT_EQ(first[i].median_ms, third[i].median_ms);
        EXPECT_EQ(first[i].max_ms, third[i].max_ms);
    }
}

TEST(CountryAggregatorTest, EmptyInput) {
    EXPECT_TRUE(CountryAggregator::aggregate({}).empty());
}
