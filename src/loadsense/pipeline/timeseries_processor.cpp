#include "loadsense/pipeline/timeseries_processor.h"
#include "loadsense/common/logger.h"
#include "loadsense/core/error.h"

#include <algorithm>
#include <exception>
#include <string>

namespace loadsense {
namespace pipeline {

namespace {

bool HasUsage(const core::ResourceSeries& series) {
    return std::any_of(series.points.begin(), series.points.end(),
                       [](const core::ResourceUsagePoint& point) { return point.usage.has_value(); });
}

} // namespace

const core::ProcessorConfig& TimeseriesProcessor::Validated(const core::ProcessorConfig& config) {
    auto status = config.Validate();
    if (!status.ok()) {
        throw core::InvalidArgumentError("Invalid processor config: " + status.error());
    }
    return config;
}

TimeseriesProcessor::TimeseriesProcessor(const core::ProcessorConfig& config)
    : config_(Validated(config)),
      trimmer_(config_),
      summary_(config_) {}

core::PerformanceContext TimeseriesProcessor::process_performance(
    const std::vector<core::TelemetryPoint>& points, bool remove_noise) const {
    if (points.empty()) {
        return {{}, kNoPerformanceData};
    }

    try {
        std::vector<core::TelemetryPoint> overall;
        std::vector<core::TelemetryPoint> scenarios;
        for (const auto& point : points) {
            if (point.is_aggregate()) {
                overall.push_back(point);
            } else {
                scenarios.push_back(point);
            }
        }

        LOADSENSE_INFO("Processing performance timeseries: {} overall points, {} scenario points",
                       overall.size(), scenarios.size());

        // Scenario samples are only trimmed alongside an aggregate series
        if (remove_noise && !overall.empty()) {
            overall = trimmer_.trim(overall);
            scenarios = trimmer_.trim(scenarios);
        }

        core::PerformanceContext context;
        context.summary_text = summary_.performance(overall, scenarios);
        context.cleaned_points = std::move(overall);
        context.cleaned_points.insert(context.cleaned_points.end(),
                                      std::make_move_iterator(scenarios.begin()),
                                      std::make_move_iterator(scenarios.end()));

        LOADSENSE_INFO("Processed performance timeseries: {} points retained",
                       context.cleaned_points.size());
        return context;
    } catch (const std::exception& e) {
        LOADSENSE_ERROR("Error processing performance timeseries data: {}", e.what());
        return {points, kPerformanceFailure};
    }
}

core::ResourceContext TimeseriesProcessor::process_resources(
    const std::vector<core::ResourceSeries>& series, bool remove_noise) const {
    if (series.empty()) {
        return {{}, kNoResourceData};
    }

    try {
        core::ResourceContext context;
        for (const auto& pod : series) {
            if (pod.points.empty() || !HasUsage(pod)) {
                LOADSENSE_DEBUG("Skipping pod {} without usage data", pod.pod_name);
                continue;
            }

            core::ResourceSeries processed;
            processed.pod_name = pod.pod_name;
            processed.service_type = pod.service_type;
            processed.points = remove_noise ? trimmer_.trim(pod.points) : pod.points;
            context.cleaned_points.push_back(std::move(processed));
        }

        context.summary_text = context.cleaned_points.empty()
            ? std::string(kNoResourceData)
            : summary_.resources(context.cleaned_points);

        LOADSENSE_INFO("Processed resource timeseries: {} of {} pods retained",
                       context.cleaned_points.size(), series.size());
        return context;
    } catch (const std::exception& e) {
        LOADSENSE_ERROR("Error processing resource timeseries data: {}", e.what());
        return {series, kResourceFailure};
    }
}

} // namespace pipeline
} // namespace loadsense
