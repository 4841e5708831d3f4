#pragma once

#include <optional>
#include <string>
#include <vector>

#include "loadsense/core/types.h"

namespace loadsense {
namespace testutil {

inline core::TelemetryPoint MakePoint(core::Timestamp ts,
                                      std::optional<double> tps,
                                      std::optional<double> vus = std::nullopt,
                                      std::optional<std::string> scenario = std::nullopt) {
    core::TelemetryPoint point;
    point.timestamp = ts;
    point.tps = tps;
    point.vus = vus;
    point.scenario_name = std::move(scenario);
    return point;
}

// One aggregate point per second starting at t=0, tps taken from values
inline std::vector<core::TelemetryPoint> TpsSeries(const std::vector<double>& values) {
    std::vector<core::TelemetryPoint> points;
    for (size_t i = 0; i < values.size(); ++i) {
        points.push_back(MakePoint(static_cast<core::Timestamp>(i) * 1000, values[i]));
    }
    return points;
}

inline std::vector<core::ResourceUsagePoint> UsageSeries(const std::vector<double>& cpu,
                                                         double memory = 40.0) {
    std::vector<core::ResourceUsagePoint> points;
    for (size_t i = 0; i < cpu.size(); ++i) {
        core::ResourceUsagePoint point;
        point.timestamp = static_cast<core::Timestamp>(i) * 1000;
        point.usage = core::ResourceUsage{cpu[i], memory};
        points.push_back(point);
    }
    return points;
}

inline std::vector<core::Timestamp> Timestamps(const std::vector<core::TelemetryPoint>& points) {
    std::vector<core::Timestamp> out;
    for (const auto& point : points) {
        out.push_back(point.timestamp);
    }
    return out;
}

} // namespace testutil
} // namespace loadsense
