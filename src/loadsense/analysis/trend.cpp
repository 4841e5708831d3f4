#include "loadsense/analysis/trend.h"
#include "loadsense/analysis/statistics.h"

namespace loadsense {
namespace analysis {

const char* TrendName(Trend trend) {
    switch (trend) {
        case Trend::INCREASING:
            return "increasing";
        case Trend::DECREASING:
            return "decreasing";
        case Trend::STABLE:
            return "stable";
    }
    return "stable";
}

Trend TrendClassifier::classify(const std::vector<double>& values) const {
    if (values.size() < 3) {
        return Trend::STABLE;
    }

    const auto mid = values.begin() + static_cast<std::ptrdiff_t>(values.size() / 2);
    const double first_avg = Mean(std::vector<double>(values.begin(), mid));
    const double second_avg = Mean(std::vector<double>(mid, values.end()));

    if (first_avg == 0.0) {
        return second_avg > first_avg ? Trend::INCREASING : Trend::STABLE;
    }

    const double change = (second_avg - first_avg) / first_avg * 100.0;
    if (change > change_percent_) {
        return Trend::INCREASING;
    }
    if (change < -change_percent_) {
        return Trend::DECREASING;
    }
    return Trend::STABLE;
}

} // namespace analysis
} // namespace loadsense
