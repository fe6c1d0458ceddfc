#ifndef COUNTRY_AGGREGATOR_HPP
#define COUNTRY_AGGREGATOR_HPP

#include "../ur-resolverbench-shared/include/CountryStatsSerializer.hpp"
#include "../ur-resolverbench-shared/include/ProbeAttemptSerializer.hpp"
#include <vector>

using ResolverBench::Shared::CountryStats;
using ResolverBench::Shared::TargetSummary;

// Per-country latency statistics over the union of all samples in the country.
class CountryAggregator {
public:
    // Pure function of the summary set. Result is sorted by country code.
    static std::vector<CountryStats> aggregate(const std::vector<TargetSummary>& summaries);

    // Expects ascending input; even sizes average the two middle values.
    static double median(const std::vector<double>& sorted_samples);
};

#endif // COUNTRY_AGGREGATOR_HPP
