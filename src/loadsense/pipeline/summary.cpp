#include "loadsense/pipeline/summary.h"
#include "loadsense/analysis/statistics.h"
#include "loadsense/common/logger.h"

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <set>
#include <sstream>

namespace loadsense {
namespace pipeline {

namespace {

std::string FormatFixed(double value, int precision) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value;
    return out.str();
}

// Virtual users are usually whole numbers; print them without a fraction
std::string FormatPlain(double value) {
    if (std::trunc(value) == value && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<int64_t>(value));
    }
    return FormatFixed(value, 2);
}

std::string JoinLines(const std::vector<std::string>& lines) {
    std::string text;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            text += '\n';
        }
        text += lines[i];
    }
    return text;
}

} // namespace

SummaryBuilder::SummaryBuilder(const core::ProcessorConfig& config)
    : trend_(config.trend_change_percent),
      shape_(config),
      correlation_(config) {}

std::string SummaryBuilder::performance(const std::vector<core::TelemetryPoint>& overall,
                                        const std::vector<core::TelemetryPoint>& scenarios) const {
    std::vector<std::string> lines;

    if (!overall.empty()) {
        const auto tps = core::ExtractField(overall, core::TelemetryField::TPS);
        const auto response_times = core::ExtractField(overall, core::TelemetryField::AVG_RESPONSE_TIME);
        const auto error_rates = core::ExtractField(overall, core::TelemetryField::ERROR_RATE);
        const auto vus = core::ExtractField(overall, core::TelemetryField::VUS);

        lines.emplace_back("**Load test performance timeseries patterns**:");

        if (const auto range = analysis::Range(tps)) {
            lines.push_back(std::string("- TPS trend: ") + analysis::TrendName(trend_.classify(tps)) +
                            " (min " + FormatFixed(range->min, 1) +
                            " -> max " + FormatFixed(range->max, 1) + ")");
        }

        if (const auto range = analysis::Range(response_times)) {
            lines.push_back(std::string("- Response time trend: ") +
                            analysis::TrendName(trend_.classify(response_times)) +
                            " (min " + FormatFixed(range->min, 1) +
                            "ms -> max " + FormatFixed(range->max, 1) + "ms)");
        }

        if (const auto range = analysis::Range(error_rates)) {
            lines.push_back(std::string("- Error rate trend: ") +
                            analysis::TrendName(trend_.classify(error_rates)) +
                            " (min " + FormatFixed(range->min, 2) +
                            "% -> max " + FormatFixed(range->max, 2) + "%)");
        }

        if (const auto range = analysis::Range(vus)) {
            const auto vus_trend = trend_.classify(vus);
            const auto shape = shape_.classify(vus);
            const std::string pattern = shape.describe();

            lines.push_back(std::string("- Virtual users: ") + analysis::TrendName(vus_trend) +
                            " (min " + FormatPlain(range->min) +
                            " -> max " + FormatPlain(range->max) + ")");
            lines.push_back("  * VU pattern: " + pattern);

            LOADSENSE_INFO("VU pattern analysis - trend: {}, pattern: {}, range: {}-{}",
                           analysis::TrendName(vus_trend), pattern, range->min, range->max);

            if (shape.is_ramp()) {
                const auto correlation = correlation_.correlate(overall);
                if (correlation.correlation != analysis::CorrelationStrength::INSUFFICIENT_DATA) {
                    lines.push_back(std::string("  * TPS-VU correlation: ") +
                                    analysis::ScalingPatternName(correlation.pattern) +
                                    " (coefficient " + FormatFixed(correlation.coefficient, 3) + ")");
                    LOADSENSE_INFO("TPS-VU correlation analysis: {}", correlation.to_string());
                }
            }
        }

        lines.push_back("- Retained data points: " + std::to_string(overall.size()));
    }

    if (!scenarios.empty()) {
        std::set<std::string> names;
        for (const auto& point : scenarios) {
            if (point.scenario_name && !point.scenario_name->empty()) {
                names.insert(*point.scenario_name);
            }
        }
        lines.push_back("- Scenario breakdown available: " + std::to_string(names.size()) + " scenarios");
    }

    lines.emplace_back("");
    return JoinLines(lines);
}

std::string SummaryBuilder::resources(const std::vector<core::ResourceSeries>& series) const {
    std::vector<std::string> lines;

    if (!series.empty()) {
        lines.emplace_back("**Resource usage timeseries patterns**:");
    }

    for (const auto& pod : series) {
        if (pod.points.empty()) {
            continue;
        }

        std::vector<double> cpu;
        std::vector<double> memory;
        for (const auto& point : pod.points) {
            if (point.usage) {
                cpu.push_back(point.usage->cpu_percent);
                memory.push_back(point.usage->memory_percent);
            }
        }

        lines.push_back("- " + pod.pod_name + " (" + pod.service_type + "):");

        if (const auto range = analysis::Range(cpu)) {
            lines.push_back(std::string("  * CPU usage trend: ") + analysis::TrendName(trend_.classify(cpu)) +
                            " (range: " + FormatFixed(range->min, 1) + "% - " +
                            FormatFixed(range->max, 1) + "%)");
        }
        if (const auto range = analysis::Range(memory)) {
            lines.push_back(std::string("  * Memory usage trend: ") +
                            analysis::TrendName(trend_.classify(memory)) +
                            " (range: " + FormatFixed(range->min, 1) + "% - " +
                            FormatFixed(range->max, 1) + "%)");
        }

        lines.push_back("  * Data points: " + std::to_string(pod.points.size()));
    }

    lines.emplace_back("");
    return JoinLines(lines);
}

} // namespace pipeline
} // namespace loadsense
