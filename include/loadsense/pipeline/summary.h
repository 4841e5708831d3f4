#ifndef LOADSENSE_PIPELINE_SUMMARY_H_
#define LOADSENSE_PIPELINE_SUMMARY_H_

#include <string>
#include <vector>

#include "loadsense/analysis/correlation.h"
#include "loadsense/analysis/load_shape.h"
#include "loadsense/analysis/trend.h"
#include "loadsense/core/config.h"
#include "loadsense/core/types.h"

namespace loadsense {
namespace pipeline {

/**
 * @brief Renders the report text handed to downstream reasoning
 *
 * Lines are joined with '\n' and the text always ends with an empty line.
 * Performance report:
 * ```
 * **Load test performance timeseries patterns**:
 * - TPS trend: increasing (min 10.0 -> max 52.5)
 * - Response time trend: stable (min 110.0ms -> max 131.2ms)
 * - Error rate trend: stable (min 0.00% -> max 0.50%)
 * - Virtual users: increasing (min 10 -> max 92)
 *   * VU pattern: ramping-vus pattern (3 stages, 10->92 VU)
 *   * TPS-VU correlation: linear-scaling (coefficient 0.998)
 * - Retained data points: 18
 * - Scenario breakdown available: 2 scenarios
 * ```
 * Resource report:
 * ```
 * **Resource usage timeseries patterns**:
 * - api-7f9c (backend):
 *   * CPU usage trend: increasing (range: 12.0% - 64.5%)
 *   * Memory usage trend: stable (range: 40.2% - 42.0%)
 *   * Data points: 27
 * ```
 */
class SummaryBuilder {
public:
    explicit SummaryBuilder(const core::ProcessorConfig& config = core::ProcessorConfig::Default());

    std::string performance(const std::vector<core::TelemetryPoint>& overall,
                            const std::vector<core::TelemetryPoint>& scenarios) const;

    std::string resources(const std::vector<core::ResourceSeries>& series) const;

private:
    analysis::TrendClassifier trend_;
    analysis::LoadShapeClassifier shape_;
    analysis::CorrelationAnalyzer correlation_;
};

} // namespace pipeline
} // namespace loadsense

#endif // LOADSENSE_PIPELINE_SUMMARY_H_
