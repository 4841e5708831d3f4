#include "loadsense/analysis/load_shape.h"
#include "loadsense/analysis/statistics.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>

namespace loadsense {
namespace analysis {

namespace {

constexpr size_t kMinShapePoints = 5;
constexpr size_t kMinStagePoints = 10;
constexpr double kConstantRange = 5.0;
constexpr double kStableStep = 1.0;
constexpr double kRampVarianceRatio = 2.0;

// VU levels are reported truncated toward zero
int64_t Whole(double value) {
    return static_cast<int64_t>(value);
}

} // namespace

const char* LoadShapeKindName(LoadShapeKind kind) {
    switch (kind) {
        case LoadShapeKind::INSUFFICIENT_DATA:
            return "insufficient-data";
        case LoadShapeKind::CONSTANT:
            return "constant";
        case LoadShapeKind::STAGED_RAMP:
            return "staged-ramp";
        case LoadShapeKind::CONTINUOUS_RAMP:
            return "continuous-ramp";
        case LoadShapeKind::FINE_ADJUSTMENT:
            return "fine-adjustment";
        case LoadShapeKind::QUASI_STABLE:
            return "quasi-stable";
    }
    return "insufficient-data";
}

std::string LoadShape::describe() const {
    std::ostringstream out;
    switch (kind) {
        case LoadShapeKind::INSUFFICIENT_DATA:
            out << "insufficient data";
            break;
        case LoadShapeKind::CONSTANT:
            out << "constant-vus pattern (stable, VU=" << Whole(avg_vus) << ")";
            break;
        case LoadShapeKind::STAGED_RAMP:
            out << "ramping-vus pattern (" << stages << " stages, "
                << Whole(min_vus) << "->" << Whole(max_vus) << " VU)";
            break;
        case LoadShapeKind::CONTINUOUS_RAMP:
            out << "continuous ramp pattern (" << Whole(min_vus) << "->" << Whole(max_vus) << " VU)";
            break;
        case LoadShapeKind::FINE_ADJUSTMENT:
            out << "fine adjustment pattern (range: " << Whole(min_vus) << "-" << Whole(max_vus) << " VU)";
            break;
        case LoadShapeKind::QUASI_STABLE:
            out << "quasi-stable pattern (average VU=" << Whole(avg_vus)
                << ", range " << Whole(max_vus - min_vus) << ")";
            break;
    }
    return out.str();
}

LoadShapeClassifier::LoadShapeClassifier(const core::ProcessorConfig& config)
    : stage_tolerance_(config.stage_tolerance),
      min_stage_length_(config.min_stage_length),
      max_stages_(config.max_stages) {}

LoadShape LoadShapeClassifier::classify(const std::vector<double>& vus) const {
    LoadShape shape;
    if (vus.size() < kMinShapePoints) {
        return shape;
    }

    const auto range = Range(vus);
    shape.min_vus = range->min;
    shape.max_vus = range->max;
    shape.avg_vus = Mean(vus);

    const double vu_range = shape.max_vus - shape.min_vus;
    const double variance_ratio = shape.min_vus > 0.0
        ? shape.max_vus / shape.min_vus
        : std::numeric_limits<double>::infinity();

    for (size_t i = 1; i < vus.size(); ++i) {
        if (std::abs(vus[i] - vus[i - 1]) <= kStableStep) {
            ++shape.stable_transitions;
        } else {
            ++shape.changing_transitions;
        }
    }

    if (vu_range <= kConstantRange) {
        shape.kind = LoadShapeKind::CONSTANT;
    } else if (shape.changing_transitions > shape.stable_transitions) {
        if (variance_ratio > kRampVarianceRatio) {
            const size_t stages = detect_stages(vus);
            if (stages > 1) {
                shape.kind = LoadShapeKind::STAGED_RAMP;
                shape.stages = stages;
            } else {
                shape.kind = LoadShapeKind::CONTINUOUS_RAMP;
            }
        } else {
            shape.kind = LoadShapeKind::FINE_ADJUSTMENT;
        }
    } else {
        shape.kind = LoadShapeKind::QUASI_STABLE;
    }
    return shape;
}

size_t LoadShapeClassifier::detect_stages(const std::vector<double>& vus) const {
    if (vus.size() < kMinStagePoints) {
        return 1;
    }

    size_t stages = 1;
    double current_stage_vus = vus.front();
    size_t run_length = 1;

    for (size_t i = 1; i < vus.size(); ++i) {
        if (std::abs(vus[i] - current_stage_vus) <= stage_tolerance_) {
            ++run_length;
            continue;
        }
        if (run_length >= min_stage_length_) {
            ++stages;
        }
        current_stage_vus = vus[i];
        run_length = 1;
    }

    return std::min(stages, max_stages_);
}

} // namespace analysis
} // namespace loadsense
