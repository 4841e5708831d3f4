#include "loadsense/analysis/correlation.h"
#include "loadsense/common/logger.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace loadsense {
namespace analysis {

namespace {

double RoundTo(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

} // namespace

const char* CorrelationStrengthName(CorrelationStrength strength) {
    switch (strength) {
        case CorrelationStrength::INSUFFICIENT_DATA:
            return "insufficient-data";
        case CorrelationStrength::CALCULATION_ERROR:
            return "calculation-error";
        case CorrelationStrength::STRONG_POSITIVE:
            return "strong-positive";
        case CorrelationStrength::MODERATE_POSITIVE:
            return "moderate-positive";
        case CorrelationStrength::WEAK_POSITIVE:
            return "weak-positive";
        case CorrelationStrength::NO_CORRELATION:
            return "no-correlation";
    }
    return "unknown";
}

const char* ScalingPatternName(ScalingPattern pattern) {
    switch (pattern) {
        case ScalingPattern::UNKNOWN:
            return "unknown";
        case ScalingPattern::LINEAR_SCALING:
            return "linear-scaling";
        case ScalingPattern::MODERATE_SCALING:
            return "moderate-scaling";
        case ScalingPattern::POOR_SCALING:
            return "poor-scaling";
        case ScalingPattern::BOTTLENECKED:
            return "bottlenecked";
    }
    return "unknown";
}

std::string CorrelationResult::to_string() const {
    std::ostringstream out;
    out << "correlation=" << CorrelationStrengthName(correlation)
        << " coefficient=" << std::fixed << std::setprecision(3) << coefficient
        << " pattern=" << ScalingPatternName(pattern);
    if (has_ranges()) {
        out << " scaling_ratio=" << std::setprecision(2) << scaling_ratio
            << " vu_range=" << std::setprecision(0) << vus_range.min << "-" << vus_range.max
            << " tps_range=" << std::setprecision(1) << tps_range.min << "-" << tps_range.max;
    }
    return out.str();
}

CorrelationAnalyzer::CorrelationAnalyzer(const core::ProcessorConfig& config)
    : min_points_(config.min_correlation_points),
      min_pairs_(config.min_correlation_pairs) {}

CorrelationResult CorrelationAnalyzer::correlate(const std::vector<core::TelemetryPoint>& points) const {
    CorrelationResult result;
    if (points.size() < min_points_) {
        return result;
    }

    std::vector<double> vus;
    std::vector<double> tps;
    vus.reserve(points.size());
    tps.reserve(points.size());
    for (const auto& point : points) {
        if (point.vus && point.tps && *point.vus > 0.0 && *point.tps > 0.0) {
            vus.push_back(*point.vus);
            tps.push_back(*point.tps);
        }
    }

    result.pairs = vus.size();
    if (vus.size() < min_pairs_) {
        return result;
    }

    const auto r = PearsonCorrelation(vus, tps);
    if (!r) {
        LOADSENSE_ERROR("Error calculating TPS-VU correlation over {} pairs: degenerate variance",
                        vus.size());
        result.correlation = CorrelationStrength::CALCULATION_ERROR;
        return result;
    }

    if (*r >= 0.8) {
        result.correlation = CorrelationStrength::STRONG_POSITIVE;
        result.pattern = ScalingPattern::LINEAR_SCALING;
    } else if (*r >= 0.6) {
        result.correlation = CorrelationStrength::MODERATE_POSITIVE;
        result.pattern = ScalingPattern::MODERATE_SCALING;
    } else if (*r >= 0.3) {
        result.correlation = CorrelationStrength::WEAK_POSITIVE;
        result.pattern = ScalingPattern::POOR_SCALING;
    } else {
        result.correlation = CorrelationStrength::NO_CORRELATION;
        result.pattern = ScalingPattern::BOTTLENECKED;
    }

    result.vus_range = *Range(vus);
    result.tps_range = *Range(tps);
    const double vus_span = result.vus_range.span();
    result.scaling_ratio = vus_span > 0.0 ? RoundTo(result.tps_range.span() / vus_span, 2) : 0.0;
    result.coefficient = RoundTo(*r, 3);
    return result;
}

} // namespace analysis
} // namespace loadsense
