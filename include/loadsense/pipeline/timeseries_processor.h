#ifndef LOADSENSE_PIPELINE_TIMESERIES_PROCESSOR_H_
#define LOADSENSE_PIPELINE_TIMESERIES_PROCESSOR_H_

#include <vector>

#include "loadsense/analysis/noise_trimmer.h"
#include "loadsense/core/config.h"
#include "loadsense/core/types.h"
#include "loadsense/pipeline/summary.h"

namespace loadsense {
namespace pipeline {

/**
 * @brief Entry points of the preprocessing engine
 *
 * Both entry points are total: an empty input yields an empty output with
 * a fixed "no data" message, and any failure while processing yields the
 * original input with a fixed failure message. The processor keeps no state
 * between calls and may be shared across threads.
 */
class TimeseriesProcessor {
public:
    static constexpr const char* kNoPerformanceData = "No timeseries data available.";
    static constexpr const char* kNoResourceData = "No resource usage data available.";
    static constexpr const char* kPerformanceFailure =
        "An error occurred while processing timeseries data.";
    static constexpr const char* kResourceFailure =
        "An error occurred while processing resource timeseries data.";

    /**
     * @throws core::InvalidArgumentError if the configuration does not validate
     */
    explicit TimeseriesProcessor(const core::ProcessorConfig& config = core::ProcessorConfig::Default());

    /**
     * @brief Clean and summarize load test performance telemetry
     *
     * Aggregate samples (no scenario name) and per-scenario samples are
     * trimmed separately when remove_noise is set and aggregate samples
     * exist; scenario-only input is never trimmed. The cleaned output is the
     * aggregate subset followed by the per-scenario subset.
     */
    core::PerformanceContext process_performance(const std::vector<core::TelemetryPoint>& points,
                                                 bool remove_noise = false) const;

    /**
     * @brief Clean and summarize per-pod resource utilization
     *
     * Pods without any usage reading are dropped. When remove_noise is set,
     * each pod's series is trimmed without outlier rejection.
     */
    core::ResourceContext process_resources(const std::vector<core::ResourceSeries>& series,
                                            bool remove_noise = false) const;

    const core::ProcessorConfig& config() const { return config_; }

private:
    static const core::ProcessorConfig& Validated(const core::ProcessorConfig& config);

    core::ProcessorConfig config_;
    analysis::NoiseTrimmer trimmer_;
    SummaryBuilder summary_;
};

} // namespace pipeline
} // namespace loadsense

#endif // LOADSENSE_PIPELINE_TIMESERIES_PROCESSOR_H_
