#ifndef LOADSENSE_ANALYSIS_STATISTICS_H_
#define LOADSENSE_ANALYSIS_STATISTICS_H_

#include <optional>
#include <vector>

namespace loadsense {
namespace analysis {

/**
 * @brief Arithmetic mean; 0 for an empty input
 */
double Mean(const std::vector<double>& values);

/**
 * @brief Sample (n - 1) standard deviation; nullopt for fewer than 2 values
 */
std::optional<double> SampleStdDev(const std::vector<double>& values);

/**
 * @brief Pearson correlation coefficient of two equally sized sequences
 *
 * Returns nullopt when the sizes differ, fewer than 2 pairs are given, either
 * sequence has zero variance or the result is not finite.
 */
std::optional<double> PearsonCorrelation(const std::vector<double>& x,
                                         const std::vector<double>& y);

struct ValueRange {
    double min = 0.0;
    double max = 0.0;

    double span() const { return max - min; }
};

/**
 * @brief Min and max of a non-empty sequence; nullopt when empty
 * @throws core::InvalidArgumentError if any value is NaN or infinite
 */
std::optional<ValueRange> Range(const std::vector<double>& values);

} // namespace analysis
} // namespace loadsense

#endif // LOADSENSE_ANALYSIS_STATISTICS_H_
