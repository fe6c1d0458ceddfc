#ifndef COUNTRY_RECONCILER_HPP
#define COUNTRY_RECONCILER_HPP

#include "GeoProvider.hpp"
#include "RateLimiter.hpp"
#include "RunDeadline.hpp"
#include "../ur-resolverbench-shared/include/RunConfigSerializer.hpp"
#include "../ur-resolverbench-shared/include/TargetSerializer.hpp"
#include <atomic>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

using ResolverBench::Shared::LookupConfig;
using ResolverBench::Shared::Target;

struct ReconcileReport {
    size_t targets;
    size_t provider_calls;
    size_t cache_hits;
    size_t corrected;
    size_t failed;
    size_t skipped;     // not looked up because the run deadline passed
    bool truncated;

    ReconcileReport()
        : targets(0),
          provider_calls(0),
          cache_hits(0),
          corrected(0),
          failed(0),
          skipped(0),
          truncated(false) {}
};

/**
 * @brief Cross-checks each target's claimed country against a geolocation
 * provider and records the provider's answer when the two disagree.
 *
 * Every IP reaches the provider at most once for the lifetime of the
 * reconciler: results, failures included, are cached by IP, and concurrent
 * requests for an IP already in flight wait for that lookup instead of
 * issuing their own. Lookups run on their own pool of `concurrency` workers,
 * spaced by `min_interval_ms`, and stop reaching the provider once
 * `max_lookups` calls have been made. A failed lookup leaves the target's
 * claimed country in place and is logged as a warning.
 */
class CountryReconciler {
public:
    CountryReconciler(GeoProvider& provider, const LookupConfig& config, RunDeadline& deadline);

    ReconcileReport reconcile(std::vector<Target>& targets);

    // Cached or fresh result for one IP.
    GeoLookupResult lookup(const std::string& ip, bool& cache_hit);

private:
    GeoProvider& provider_;
    LookupConfig config_;
    RunDeadline& deadline_;
    RateLimiter rate_limiter_;

    std::mutex cache_mutex_;
    std::unordered_map<std::string, std::shared_future<GeoLookupResult>> cache_;
    std::atomic<size_t> provider_calls_;
    std::atomic<size_t> quota_used_;

    GeoLookupResult callProvider(const std::string& ip);
};

#endif // COUNTRY_RECONCILER_HPP
