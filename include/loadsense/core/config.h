#ifndef LOADSENSE_CORE_CONFIG_H_
#define LOADSENSE_CORE_CONFIG_H_

#include <cstddef>
#include <cstdint>

#include "loadsense/core/result.h"

namespace loadsense {
namespace core {

/**
 * @brief Tuning parameters of the preprocessing pipeline
 */
struct ProcessorConfig {
    double startup_trim_ratio;          // Head fraction treated as ramp-up
    double shutdown_trim_ratio;         // Tail fraction treated as ramp-down
    double outlier_threshold;           // Z-score above which a sample is rejected
    size_t min_trim_points;             // Shorter series are never trimmed
    size_t min_outlier_points;          // Minimum sample for a standard deviation
    double trend_change_percent;        // Half-over-half change that counts as a trend
    double stage_tolerance;             // Max distance from the plateau value within a stage
    size_t min_stage_length;            // Samples a plateau must last to count as a stage
    size_t max_stages;                  // Stage count cap
    size_t min_correlation_points;      // Minimum aggregate points for correlation
    size_t min_correlation_pairs;       // Minimum valid (vus, tps) pairs for correlation

    // Default constructor
    ProcessorConfig() : startup_trim_ratio(0.10), shutdown_trim_ratio(0.05),
                        outlier_threshold(2.5), min_trim_points(10),
                        min_outlier_points(5), trend_change_percent(10.0),
                        stage_tolerance(2.0), min_stage_length(5), max_stages(5),
                        min_correlation_points(10), min_correlation_pairs(5) {}

    static ProcessorConfig Default() {
        return ProcessorConfig();
    }

    /**
     * @brief Check every field, reporting the first invalid one
     */
    Result<void> Validate() const;
};

/**
 * @brief Configuration of the pod resource spec cache
 */
struct PodSpecCacheConfig {
    int64_t ttl_seconds;                // Entry lifetime

    PodSpecCacheConfig() : ttl_seconds(300) {}

    static PodSpecCacheConfig Default() {
        return PodSpecCacheConfig();
    }
};

} // namespace core
} // namespace loadsense

#endif // LOADSENSE_CORE_CONFIG_H_
