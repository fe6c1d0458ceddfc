#include "../include/CountryAggregator.hpp"
#include <algorithm>
#include <map>
#include <string>

namespace {

struct CountryBucket {
    std::vector<double> samples;
    int server_count = 0;
    int unreachable_count = 0;
};

} // namespace

std::vector<CountryStats> CountryAggregator::aggregate(const std::vector<TargetSummary>& summaries) {
    std::map<std::string, CountryBucket> buckets;

    for (const auto& summary : summaries) {
        CountryBucket& bucket = buckets[summary.effective_country_code];
        if (summary.samples.empty()) {
            bucket.unreachable_count++;
            continue;
        }
        bucket.server_count++;
        bucket.samples.insert(bucket.samples.end(), summary.samples.begin(), summary.samples.end());
    }

    std::vector<CountryStats> result;
    result.reserve(buckets.size());

    for (auto& entry : buckets) {
        CountryBucket& bucket = entry.second;

        CountryStats stats;
        stats.country_code = entry.first;
        stats.server_count = bucket.server_count;
        stats.unreachable_count = bucket.unreachable_count;

        if (!bucket.samples.empty()) {
            // Sorting first also fixes the summation order of the mean.
            std::sort(bucket.samples.begin(), bucket.samples.end());

            double sum = 0.0;
            for (double sample : bucket.samples) {
                sum += sample;
            }

            stats.min_ms = bucket.samples.front();
            stats.max_ms = bucket.samples.back();
            stats.avg_ms = sum / static_cast<double>(bucket.samples.size());
            stats.median_ms = median(bucket.samples);
        }

        result.push_back(stats);
    }

    return result;
}

double CountryAggregator::median(const std::vector<double>& sorted_samples) {
    size_t n = sorted_samples.size();
    if (n == 0) {
        return 0.0;
    }
    if (n % 2 == 1) {
        return sorted_samples[n / 2];
    }
    return (sorted_samples[n / 2 - 1] + sorted_samples[n / 2]) / 2.0;
}
