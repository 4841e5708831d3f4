#ifndef LOADSENSE_ANALYSIS_CORRELATION_H_
#define LOADSENSE_ANALYSIS_CORRELATION_H_

#include <cstddef>
#include <string>
#include <vector>

#include "loadsense/analysis/statistics.h"
#include "loadsense/core/config.h"
#include "loadsense/core/types.h"

namespace loadsense {
namespace analysis {

enum class CorrelationStrength {
    INSUFFICIENT_DATA,
    CALCULATION_ERROR,
    STRONG_POSITIVE,
    MODERATE_POSITIVE,
    WEAK_POSITIVE,
    NO_CORRELATION
};

enum class ScalingPattern {
    UNKNOWN,
    LINEAR_SCALING,
    MODERATE_SCALING,
    POOR_SCALING,
    BOTTLENECKED
};

const char* CorrelationStrengthName(CorrelationStrength strength);
const char* ScalingPatternName(ScalingPattern pattern);

/**
 * @brief How throughput follows the virtual-user load
 *
 * coefficient is rounded to 3 decimals and scaling_ratio to 2. The ranges
 * are only meaningful when has_ranges() is true.
 */
struct CorrelationResult {
    CorrelationStrength correlation = CorrelationStrength::INSUFFICIENT_DATA;
    double coefficient = 0.0;
    ScalingPattern pattern = ScalingPattern::UNKNOWN;
    double scaling_ratio = 0.0;
    ValueRange vus_range;
    ValueRange tps_range;
    size_t pairs = 0;

    bool has_ranges() const {
        return correlation != CorrelationStrength::INSUFFICIENT_DATA &&
               correlation != CorrelationStrength::CALCULATION_ERROR;
    }

    std::string to_string() const;
};

/**
 * @brief Pearson correlation between concurrent load (vus) and throughput (tps)
 *
 * Only points where both vus and tps are present and strictly positive form
 * a pair. Needs min_correlation_points points and min_correlation_pairs pairs.
 */
class CorrelationAnalyzer {
public:
    explicit CorrelationAnalyzer(const core::ProcessorConfig& config = core::ProcessorConfig::Default());

    CorrelationResult correlate(const std::vector<core::TelemetryPoint>& points) const;

private:
    size_t min_points_;
    size_t min_pairs_;
};

} // namespace analysis
} // namespace loadsense

#endif // LOADSENSE_ANALYSIS_CORRELATION_H_
