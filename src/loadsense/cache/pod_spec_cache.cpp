/**
 * @file pod_spec_cache.cpp
 * @brief TTL cache of pod resource specs
 *
 * Entries are stamped with the injected clock when stored. A lookup within
 * the TTL is a hit; anything older goes back to the provider. The provider
 * call happens outside the lock so a slow lookup does not block readers of
 * other pods.
 */

#include "loadsense/cache/pod_spec_cache.h"
#include "loadsense/common/logger.h"
#include <algorithm>

namespace loadsense {
namespace cache {

namespace {

std::string FormatLimit(const std::optional<double>& value) {
    return value ? std::to_string(static_cast<int64_t>(*value)) : std::string("n/a");
}

} // namespace

PodSpecCache::PodSpecCache(std::shared_ptr<PodSpecProvider> provider,
                           const core::PodSpecCacheConfig& config,
                           Clock clock)
    : provider_(std::move(provider)),
      ttl_(config.ttl_seconds),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); })) {
    if (!provider_) {
        throw core::InvalidArgumentError("PodSpecCache requires a spec provider");
    }
    if (config.ttl_seconds <= 0) {
        throw core::InvalidArgumentError("PodSpecCache TTL must be greater than 0");
    }
    LOADSENSE_INFO("PodSpecCache initialized with TTL={}s", config.ttl_seconds);
}

bool PodSpecCache::is_fresh(const Entry& entry, std::chrono::steady_clock::time_point now) const {
    return now - entry.cached_at < ttl_;
}

std::optional<PodResourceSpec> PodSpecCache::get_pod_spec(const std::string& pod_name) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(pod_name);
        if (it != entries_.end() && is_fresh(it->second, clock_())) {
            hit_count_.fetch_add(1, std::memory_order_relaxed);
            LOADSENSE_DEBUG("Pod spec cache hit for {}", pod_name);
            return it->second.spec;
        }
    }

    miss_count_.fetch_add(1, std::memory_order_relaxed);
    LOADSENSE_INFO("Pod spec cache miss for {}, querying provider", pod_name);

    auto spec = provider_->FetchPodSpec(pod_name);
    if (!spec) {
        LOADSENSE_WARN("Failed to get pod spec for {}", pod_name);
        return std::nullopt;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[pod_name] = Entry{*spec, clock_()};
    }
    LOADSENSE_INFO("Pod spec cached for {}: CPU={}m, Memory={}MB", pod_name,
                   FormatLimit(spec->cpu_limit_millicores), FormatLimit(spec->memory_limit_mb));
    return spec;
}

bool PodSpecCache::invalidate_pod(const std::string& pod_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool removed = entries_.erase(pod_name) > 0;
    if (removed) {
        LOADSENSE_INFO("Pod spec cache invalidated for {}", pod_name);
    }
    return removed;
}

size_t PodSpecCache::cleanup_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();

    size_t removed = 0;
    // Only entries strictly older than the TTL are removed
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now - it->second.cached_at > ttl_) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        LOADSENSE_INFO("Cleaned up {} expired pod spec cache entries", removed);
    }
    return removed;
}

size_t PodSpecCache::preload(const std::string& job_name, const std::vector<std::string>& pod_names) {
    LOADSENSE_INFO("Preloading pod specs for job {}: {} pods", job_name, pod_names.size());

    size_t loaded = 0;
    for (const auto& pod_name : pod_names) {
        if (get_pod_spec(pod_name)) {
            ++loaded;
        }
    }

    LOADSENSE_INFO("Preloaded {}/{} pod specs for job {}", loaded, pod_names.size(), job_name);
    return loaded;
}

PodSpecCacheStatus PodSpecCache::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_();

    PodSpecCacheStatus status;
    status.total_entries = entries_.size();
    status.ttl_seconds = ttl_.count();
    status.hits = hit_count();
    status.misses = miss_count();

    std::chrono::steady_clock::duration oldest{0};
    for (const auto& [pod_name, entry] : entries_) {
        if (is_fresh(entry, now)) {
            ++status.active_entries;
        }
        oldest = std::max(oldest, now - entry.cached_at);
        status.cached_pods.push_back(pod_name);
    }
    std::sort(status.cached_pods.begin(), status.cached_pods.end());

    status.expired_entries = status.total_entries - status.active_entries;
    status.oldest_entry_age_seconds = std::chrono::duration<double>(oldest).count();
    return status;
}

size_t PodSpecCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace cache
} // namespace loadsense
