#include "../include/CountryReconciler.hpp"
#include "../include/FilterUtils.hpp"
#include "../include/Logger.hpp"
#include "../include/ProgressReporter.hpp"
#include "../include/WorkerPool.hpp"
#include <algorithm>

CountryReconciler::CountryReconciler(GeoProvider& provider, const LookupConfig& config, RunDeadline& deadline)
    : provider_(provider),
      config_(config),
      deadline_(deadline),
      rate_limiter_(std::chrono::milliseconds(config.min_interval_ms)),
      provider_calls_(0),
      quota_used_(0) {
}

GeoLookupResult CountryReconciler::callProvider(const std::string& ip) {
    if (config_.max_lookups > 0) {
        size_t used = quota_used_.fetch_add(1);
        if (used >= static_cast<size_t>(config_.max_lookups)) {
            return GeoLookupResult::failed(GeoLookupError::QUOTA_EXCEEDED,
                                           "Lookup quota of " + std::to_string(config_.max_lookups) +
                                           " requests used up");
        }
    }

    rate_limiter_.acquire();
    provider_calls_++;

    try {
        return provider_.lookup(ip);
    } catch (const std::exception& e) {
        return GeoLookupResult::failed(GeoLookupError::TRANSPORT, e.what());
    }
}

GeoLookupResult CountryReconciler::lookup(const std::string& ip, bool& cache_hit) {
    std::promise<GeoLookupResult> promise;
    std::shared_future<GeoLookupResult> future;

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(ip);
        if (it != cache_.end()) {
            future = it->second;
            cache_hit = true;
        } else {
            future = promise.get_future().share();
            cache_.emplace(ip, future);
            cache_hit = false;
        }
    }

    if (cache_hit) {
        // Either finished already or still in flight on another worker.
        return future.get();
    }

    promise.set_value(callProvider(ip));
    return future.get();
}

ReconcileReport CountryReconciler::reconcile(std::vector<Target>& targets) {
    ReconcileReport report;
    report.targets = targets.size();
    if (targets.empty()) {
        return report;
    }

    size_t calls_before = provider_calls_.load();
    std::atomic<size_t> cache_hits(0);
    std::atomic<size_t> corrected(0);
    std::atomic<size_t> failed(0);
    std::atomic<size_t> skipped(0);

    size_t worker_count = std::min(static_cast<size_t>(std::max(config_.concurrency, 1)), targets.size());
    LOG_INFO("[CountryReconciler] Resolving countries of " + std::to_string(targets.size()) +
             " targets with " + std::to_string(worker_count) + " concurrent lookups");

    ProgressReporter progress("CountryReconciler", targets.size());

    {
        WorkerPool pool("LookupPool", worker_count);

        for (size_t i = 0; i < targets.size(); i++) {
            bool queued = pool.submit([&, i](size_t) {
                Target& target = targets[i];

                if (deadline_.expired()) {
                    skipped++;
                    progress.advance();
                    return;
                }

                bool cache_hit = false;
                GeoLookupResult result = lookup(target.ip_address, cache_hit);
                if (cache_hit) {
                    cache_hits++;
                }

                if (!result.success) {
                    failed++;
                    LOG_WARNING("[CountryReconciler] Could not resolve country for " + target.ip_address +
                                " (claimed " + target.claimed_country_code + "): " +
                                geo_error_to_string(result.error) + " " + result.error_message);
                    progress.advance();
                    return;
                }

                if (result.country_code != target.claimed_country_code) {
                    LOG_DEBUG("[CountryReconciler] " + target.ip_address + " moved from " +
                              target.claimed_country_code + " to " + result.country_code);
                    target.resolved_country_code = result.country_code;
                    corrected++;
                }
                if (trim(target.city).empty() && !result.city.empty()) {
                    target.city = result.city;
                }
                progress.advance();
            });
            if (!queued) {
                skipped++;
            }
        }

        pool.waitIdle();
        pool.shutdown();
    }

    report.provider_calls = provider_calls_.load() - calls_before;
    report.cache_hits = cache_hits.load();
    report.corrected = corrected.load();
    report.failed = failed.load();
    report.skipped = skipped.load();
    report.truncated = report.skipped > 0;

    if (report.truncated) {
        LOG_WARNING("[CountryReconciler] Run deadline reached, " + std::to_string(report.skipped) +
                    " targets keep their claimed country unchecked");
    }
    LOG_INFO("[CountryReconciler] " + std::to_string(report.corrected) + " targets corrected, " +
             std::to_string(report.failed) + " lookups failed, " +
             std::to_string(report.provider_calls) + " provider calls");

    return report;
}
