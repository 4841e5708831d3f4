#ifndef LOADSENSE_ANALYSIS_NOISE_TRIMMER_H_
#define LOADSENSE_ANALYSIS_NOISE_TRIMMER_H_

#include <cstddef>
#include <utility>
#include <vector>

#include "loadsense/analysis/outlier_filter.h"
#include "loadsense/core/config.h"
#include "loadsense/core/types.h"

namespace loadsense {
namespace analysis {

/**
 * @brief Removes ramp-up and ramp-down regions from a series
 *
 * Series shorter than min_points are returned unchanged. Longer series are
 * sorted by timestamp and cut to [floor(start * N), N - floor(end * N)).
 * Performance series are then passed through the outlier filter on tps;
 * resource series are only trimmed.
 *
 * Trimming is not a fixed point: trimming an already trimmed series of at
 * least min_points samples removes the head and tail fractions again,
 * computed on the shorter length.
 */
class NoiseTrimmer {
public:
    explicit NoiseTrimmer(const core::ProcessorConfig& config = core::ProcessorConfig::Default());

    std::vector<core::TelemetryPoint> trim(const std::vector<core::TelemetryPoint>& series) const;
    std::vector<core::ResourceUsagePoint> trim(const std::vector<core::ResourceUsagePoint>& series) const;

    /**
     * @brief Half-open index range kept out of a sorted series of n samples
     *
     * Falls back to the middle half [floor(0.25n), floor(0.75n)) when the
     * head and tail cuts would consume the whole series.
     */
    static std::pair<size_t, size_t> SteadyStateBounds(size_t n,
                                                       double startup_ratio,
                                                       double shutdown_ratio);

private:
    template<typename Record>
    std::vector<Record> trim_sorted_window(const std::vector<Record>& series) const;

    double startup_ratio_;
    double shutdown_ratio_;
    size_t min_points_;
    OutlierFilter outlier_filter_;
};

} // namespace analysis
} // namespace loadsense

#endif // LOADSENSE_ANALYSIS_NOISE_TRIMMER_H_
