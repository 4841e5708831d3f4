#include "loadsense/analysis/outlier_filter.h"
#include "loadsense/analysis/statistics.h"
#include "loadsense/common/logger.h"
#include "loadsense/core/error.h"

#include <cmath>

namespace loadsense {
namespace analysis {

OutlierFilter::OutlierFilter(double threshold, size_t min_points)
    : threshold_(threshold), min_points_(min_points) {
    if (!(threshold > 0.0)) {
        throw core::InvalidArgumentError("Outlier threshold must be positive");
    }
    if (min_points < 2) {
        throw core::InvalidArgumentError("Outlier filter needs at least 2 points for a standard deviation");
    }
}

std::vector<core::TelemetryPoint> OutlierFilter::filter(
    const std::vector<core::TelemetryPoint>& series, core::TelemetryField field) const {
    if (series.size() < min_points_) {
        return series;
    }

    const std::vector<double> values = core::ExtractField(series, field);
    if (values.size() < min_points_) {
        return series;
    }

    const double mean = Mean(values);
    const auto stddev = SampleStdDev(values);
    if (!stddev || *stddev == 0.0) {
        // All values identical
        return series;
    }

    std::vector<core::TelemetryPoint> filtered;
    filtered.reserve(series.size());
    for (const auto& point : series) {
        const auto value = core::FieldValue(point, field);
        if (!value) {
            filtered.push_back(point);
            continue;
        }
        const double z_score = std::abs(*value - mean) / *stddev;
        if (z_score <= threshold_) {
            filtered.push_back(point);
        }
    }

    if (filtered.empty()) {
        LOADSENSE_WARN("Outlier filter on {} rejected every sample, keeping original {} points",
                       core::FieldName(field), series.size());
        return series;
    }

    LOADSENSE_DEBUG("Outlier filter on {}: {} -> {} points (mean={:.3f}, stddev={:.3f})",
                    core::FieldName(field), series.size(), filtered.size(), mean, *stddev);
    return filtered;
}

} // namespace analysis
} // namespace loadsense
