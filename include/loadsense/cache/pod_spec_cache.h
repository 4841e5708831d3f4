#pragma once

#include "loadsense/core/config.h"
#include "loadsense/core/error.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace loadsense {
namespace cache {

/**
 * @brief CPU and memory requests/limits of a pod
 */
struct PodResourceSpec {
    std::optional<double> cpu_request_millicores;
    std::optional<double> cpu_limit_millicores;
    std::optional<double> memory_request_mb;
    std::optional<double> memory_limit_mb;
};

/**
 * @brief Source of pod resource specs (e.g. the cluster API)
 */
class PodSpecProvider {
public:
    virtual ~PodSpecProvider() = default;

    /**
     * @brief Look up a pod's spec
     * @return The spec, or nullopt if the pod is unknown or the lookup failed
     */
    virtual std::optional<PodResourceSpec> FetchPodSpec(const std::string& pod_name) = 0;
};

/**
 * @brief Snapshot of the cache contents
 */
struct PodSpecCacheStatus {
    size_t total_entries = 0;
    size_t active_entries = 0;
    size_t expired_entries = 0;
    int64_t ttl_seconds = 0;
    double oldest_entry_age_seconds = 0.0;
    std::vector<std::string> cached_pods;
    uint64_t hits = 0;
    uint64_t misses = 0;
};

/**
 * @brief TTL cache in front of a PodSpecProvider
 *
 * Pod limits rarely change, so specs are kept for ttl_seconds before the
 * provider is consulted again. Failed lookups are not cached. All methods
 * are thread-safe.
 */
class PodSpecCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    /**
     * @param clock Time source; steady_clock::now when empty
     * @throws core::InvalidArgumentError if provider is null or the TTL is not positive
     */
    explicit PodSpecCache(std::shared_ptr<PodSpecProvider> provider,
                          const core::PodSpecCacheConfig& config = core::PodSpecCacheConfig::Default(),
                          Clock clock = nullptr);

    // Disable copy constructor and assignment
    PodSpecCache(const PodSpecCache&) = delete;
    PodSpecCache& operator=(const PodSpecCache&) = delete;

    /**
     * @brief Cached spec if still fresh, otherwise a provider lookup
     */
    std::optional<PodResourceSpec> get_pod_spec(const std::string& pod_name);

    /**
     * @brief Drop a pod's entry (e.g. after a restart)
     * @return true if an entry existed
     */
    bool invalidate_pod(const std::string& pod_name);

    /**
     * @brief Remove every entry older than the TTL
     * @return Number of entries removed
     */
    size_t cleanup_expired();

    /**
     * @brief Warm the cache with the pods of a starting job
     * @return Number of pods whose spec could be loaded
     */
    size_t preload(const std::string& job_name, const std::vector<std::string>& pod_names);

    PodSpecCacheStatus status() const;

    size_t size() const;
    uint64_t hit_count() const { return hit_count_.load(std::memory_order_relaxed); }
    uint64_t miss_count() const { return miss_count_.load(std::memory_order_relaxed); }

private:
    struct Entry {
        PodResourceSpec spec;
        std::chrono::steady_clock::time_point cached_at;
    };

    bool is_fresh(const Entry& entry, std::chrono::steady_clock::time_point now) const;

    std::shared_ptr<PodSpecProvider> provider_;
    std::chrono::seconds ttl_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;

    std::atomic<uint64_t> hit_count_{0};
    std::atomic<uint64_t> miss_count_{0};
};

} // namespace cache
} // namespace loadsense
