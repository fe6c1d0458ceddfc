#include "../include/FilterUtils.hpp"
#include <gtest/gtest.h>

TEST(FilterUtilsTest, CountryAndKeywordFilters) {
    std::vector<Target> targets = {
        Target("1.1.1.1", "US", "Los Angeles"), Target("9.9.9.9", "CH", "Zurich"), Target("8.8.8.8", "US")};

    CatalogFilters by_country;
    by_country.countries = {"ch", "DE"};
    std::vector<Target> swiss = filter_targets(targets, by_country);
    ASSERT_EQ(swiss.size(), 1u);
    EXPECT_EQ(swiss[0].ip_address, "9.9.9.9");

    CatalogFilters by_keyword;
    by_keyword.keyword = "ANGELES";
    ASSERT_EQ(filter_targets(targets, by_keyword).size(), 1u);

    CatalogFilters none;
    EXPECT_EQ(filter_targets(targets, none).size(), 3u);
}

TEST(FilterUtilsTest, CountryCodeShape) {
    EXPECT_TRUE(is_country_code("DE"));
    EXPECT_FALSE(is_country_code("de"));
    EXPECT_FALSE(is_country_code("DEU"));
    EXPECT_FALSE(is_country_code("D1"));
    EXPECT_EQ(trim("  x \t"), "x");
}
