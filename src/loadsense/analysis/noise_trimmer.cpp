#include "loadsense/analysis/noise_trimmer.h"
#include "loadsense/common/logger.h"

#include <algorithm>

namespace loadsense {
namespace analysis {

NoiseTrimmer::NoiseTrimmer(const core::ProcessorConfig& config)
    : startup_ratio_(config.startup_trim_ratio),
      shutdown_ratio_(config.shutdown_trim_ratio),
      min_points_(config.min_trim_points),
      outlier_filter_(config.outlier_threshold, config.min_outlier_points) {}

std::pair<size_t, size_t> NoiseTrimmer::SteadyStateBounds(size_t n,
                                                          double startup_ratio,
                                                          double shutdown_ratio) {
    const auto start_trim = static_cast<size_t>(static_cast<double>(n) * startup_ratio);
    const auto end_trim = static_cast<size_t>(static_cast<double>(n) * shutdown_ratio);

    if (start_trim + end_trim >= n) {
        return {static_cast<size_t>(static_cast<double>(n) * 0.25),
                static_cast<size_t>(static_cast<double>(n) * 0.75)};
    }
    return {start_trim, n - end_trim};
}

template<typename Record>
std::vector<Record> NoiseTrimmer::trim_sorted_window(const std::vector<Record>& series) const {
    std::vector<Record> sorted(series);
    std::stable_sort(sorted.begin(), sorted.end(), [](const Record& a, const Record& b) {
        return a.timestamp < b.timestamp;
    });

    const auto [begin, end] = SteadyStateBounds(sorted.size(), startup_ratio_, shutdown_ratio_);
    return std::vector<Record>(sorted.begin() + static_cast<std::ptrdiff_t>(begin),
                               sorted.begin() + static_cast<std::ptrdiff_t>(end));
}

std::vector<core::TelemetryPoint> NoiseTrimmer::trim(
    const std::vector<core::TelemetryPoint>& series) const {
    if (series.size() < min_points_) {
        return series;
    }

    auto trimmed = trim_sorted_window(series);
    auto cleaned = outlier_filter_.filter(trimmed, core::TelemetryField::TPS);

    LOADSENSE_DEBUG("Noise removal: {} -> {} -> {} points",
                    series.size(), trimmed.size(), cleaned.size());
    return cleaned;
}

std::vector<core::ResourceUsagePoint> NoiseTrimmer::trim(
    const std::vector<core::ResourceUsagePoint>& series) const {
    if (series.size() < min_points_) {
        return series;
    }

    auto trimmed = trim_sorted_window(series);
    LOADSENSE_DEBUG("Resource noise removal: {} -> {} points", series.size(), trimmed.size());
    return trimmed;
}

} // namespace analysis
} // namespace loadsense
