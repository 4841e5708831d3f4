#ifndef LOADSENSE_ANALYSIS_LOAD_SHAPE_H_
#define LOADSENSE_ANALYSIS_LOAD_SHAPE_H_

#include <cstddef>
#include <string>
#include <vector>

#include "loadsense/core/config.h"

namespace loadsense {
namespace analysis {

enum class LoadShapeKind {
    INSUFFICIENT_DATA,
    CONSTANT,
    STAGED_RAMP,
    CONTINUOUS_RAMP,
    FINE_ADJUSTMENT,
    QUASI_STABLE
};

const char* LoadShapeKindName(LoadShapeKind kind);

/**
 * @brief Inferred shape of a virtual-user series
 */
struct LoadShape {
    LoadShapeKind kind = LoadShapeKind::INSUFFICIENT_DATA;
    size_t stages = 0;              // Only set for STAGED_RAMP
    double min_vus = 0.0;
    double max_vus = 0.0;
    double avg_vus = 0.0;
    size_t stable_transitions = 0;  // Adjacent pairs with |delta| <= 1
    size_t changing_transitions = 0;

    bool is_ramp() const {
        return kind == LoadShapeKind::STAGED_RAMP || kind == LoadShapeKind::CONTINUOUS_RAMP;
    }

    /**
     * @brief One-line report text, e.g. "staged ramp pattern (3 stages, 10->90 VU)"
     */
    std::string describe() const;
};

/**
 * @brief Classifies a virtual-user series as constant, staged, ramping, ...
 *
 * Decision order:
 *   - fewer than 5 samples: INSUFFICIENT_DATA
 *   - max - min <= 5: CONSTANT
 *   - more changing than stable transitions and max/min > 2:
 *     STAGED_RAMP when stage detection finds more than one stage,
 *     CONTINUOUS_RAMP otherwise
 *   - more changing than stable transitions and max/min <= 2: FINE_ADJUSTMENT
 *   - otherwise: QUASI_STABLE
 */
class LoadShapeClassifier {
public:
    explicit LoadShapeClassifier(const core::ProcessorConfig& config = core::ProcessorConfig::Default());

    LoadShape classify(const std::vector<double>& vus) const;

    /**
     * @brief Counts plateaus of at least min_stage_length samples
     *
     * Starts at 1 and adds one each time a run that lasted long enough is
     * left. The run still open at the end of the series is never counted.
     * Series shorter than 10 samples report 1. Capped at max_stages.
     */
    size_t detect_stages(const std::vector<double>& vus) const;

private:
    double stage_tolerance_;
    size_t min_stage_length_;
    size_t max_stages_;
};

} // namespace analysis
} // namespace loadsense

#endif // LOADSENSE_ANALYSIS_LOAD_SHAPE_H_
