#include "loadsense/analysis/statistics.h"
#include "loadsense/core/error.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace loadsense {
namespace analysis {

double Mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

std::optional<double> SampleStdDev(const std::vector<double>& values) {
    if (values.size() < 2) {
        return std::nullopt;
    }

    const double mean = Mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        const double diff = v - mean;
        sum_sq += diff * diff;
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
}

std::optional<double> PearsonCorrelation(const std::vector<double>& x,
                                         const std::vector<double>& y) {
    if (x.size() != y.size() || x.size() < 2) {
        return std::nullopt;
    }

    const double mean_x = Mean(x);
    const double mean_y = Mean(y);

    double cov = 0.0;
    double var_x = 0.0;
    double var_y = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        const double dx = x[i] - mean_x;
        const double dy = y[i] - mean_y;
        cov += dx * dy;
        var_x += dx * dx;
        var_y += dy * dy;
    }

    if (var_x == 0.0 || var_y == 0.0) {
        return std::nullopt;
    }

    const double r = cov / std::sqrt(var_x * var_y);
    if (!std::isfinite(r)) {
        return std::nullopt;
    }
    // Rounding can push |r| a hair past 1 for perfectly linear data
    return std::clamp(r, -1.0, 1.0);
}

std::optional<ValueRange> Range(const std::vector<double>& values) {
    if (values.empty()) {
        return std::nullopt;
    }
    if (!std::all_of(values.begin(), values.end(), [](double v) { return std::isfinite(v); })) {
        throw core::InvalidArgumentError("series contains a non-finite value");
    }
    const auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
    return ValueRange{*min_it, *max_it};
}

} // namespace analysis
} // namespace loadsense
