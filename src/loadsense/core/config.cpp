#include "loadsense/core/config.h"

#include <cmath>
#include <string>

namespace loadsense {
namespace core {

namespace {

bool IsRatio(double value) {
    return std::isfinite(value) && value >= 0.0 && value < 1.0;
}

} // namespace

Result<void> ProcessorConfig::Validate() const {
    if (!IsRatio(startup_trim_ratio)) {
        return Result<void>::error("startup_trim_ratio must be in [0, 1), got " +
                                   std::to_string(startup_trim_ratio));
    }
    if (!IsRatio(shutdown_trim_ratio)) {
        return Result<void>::error("shutdown_trim_ratio must be in [0, 1), got " +
                                   std::to_string(shutdown_trim_ratio));
    }
    if (startup_trim_ratio + shutdown_trim_ratio >= 1.0) {
        return Result<void>::error("startup and shutdown trim ratios must sum to less than 1");
    }
    if (!std::isfinite(outlier_threshold) || outlier_threshold <= 0.0) {
        return Result<void>::error("outlier_threshold must be positive");
    }
    if (min_trim_points == 0 || min_outlier_points < 2) {
        return Result<void>::error("min_trim_points must be positive and min_outlier_points at least 2");
    }
    if (!std::isfinite(trend_change_percent) || trend_change_percent < 0.0) {
        return Result<void>::error("trend_change_percent must be non-negative");
    }
    if (!std::isfinite(stage_tolerance) || stage_tolerance < 0.0) {
        return Result<void>::error("stage_tolerance must be non-negative");
    }
    if (min_stage_length == 0 || max_stages == 0) {
        return Result<void>::error("min_stage_length and max_stages must be positive");
    }
    if (min_correlation_pairs < 2 || min_correlation_points < min_correlation_pairs) {
        return Result<void>::error(
            "min_correlation_pairs must be at least 2 and not exceed min_correlation_points");
    }
    return Result<void>();
}

} // namespace core
} // namespace loadsense
