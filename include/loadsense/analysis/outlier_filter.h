#ifndef LOADSENSE_ANALYSIS_OUTLIER_FILTER_H_
#define LOADSENSE_ANALYSIS_OUTLIER_FILTER_H_

#include <vector>

#include "loadsense/core/types.h"

namespace loadsense {
namespace analysis {

/**
 * @brief Z-score based outlier rejection over one telemetry field
 *
 * Samples whose |value - mean| / stddev exceeds the threshold are dropped.
 * Samples missing the field are always kept. The input is returned unchanged
 * when fewer than min_points values are present, when the standard deviation
 * is zero, or when every sample would be dropped.
 */
class OutlierFilter {
public:
    static constexpr double kDefaultThreshold = 2.5;
    static constexpr size_t kDefaultMinPoints = 5;

    explicit OutlierFilter(double threshold = kDefaultThreshold,
                           size_t min_points = kDefaultMinPoints);

    std::vector<core::TelemetryPoint> filter(const std::vector<core::TelemetryPoint>& series,
                                             core::TelemetryField field) const;

    double threshold() const { return threshold_; }

private:
    double threshold_;
    size_t min_points_;
};

} // namespace analysis
} // namespace loadsense

#endif // LOADSENSE_ANALYSIS_OUTLIER_FILTER_H_
