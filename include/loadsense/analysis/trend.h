#ifndef LOADSENSE_ANALYSIS_TREND_H_
#define LOADSENSE_ANALYSIS_TREND_H_

#include <vector>

namespace loadsense {
namespace analysis {

enum class Trend {
    INCREASING,
    DECREASING,
    STABLE
};

const char* TrendName(Trend trend);

/**
 * @brief Labels a series by comparing the mean of its halves
 *
 * The first half is values[0, n/2) and the second half the remainder.
 * A relative change above +change_percent is INCREASING, below
 * -change_percent DECREASING. Series shorter than 3 are STABLE. A zero
 * first-half mean yields INCREASING when the second half is larger.
 */
class TrendClassifier {
public:
    static constexpr double kDefaultChangePercent = 10.0;

    explicit TrendClassifier(double change_percent = kDefaultChangePercent)
        : change_percent_(change_percent) {}

    Trend classify(const std::vector<double>& values) const;

private:
    double change_percent_;
};

} // namespace analysis
} // namespace loadsense

#endif // LOADSENSE_ANALYSIS_TREND_H_
