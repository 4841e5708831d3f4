#include <gtest/gtest.h>
#include "loadsense/analysis/statistics.h"
#include "loadsense/core/error.h"
#include <limits>
#include <vector>

namespace loadsense {
namespace analysis {
namespace {

TEST(StatisticsTest, Mean) {
    EXPECT_DOUBLE_EQ(Mean({1.0, 2.0, 3.0, 4.0}), 2.5);
    EXPECT_DOUBLE_EQ(Mean({}), 0.0);
}

TEST(StatisticsTest, SampleStdDevUsesBesselCorrection) {
    auto stddev = SampleStdDev({2, 4, 4, 4, 5, 5, 7, 9});
    ASSERT_TRUE(stddev.has_value());
    // sum of squares 32 over n - 1 = 7
    EXPECT_NEAR(*stddev, 2.1380899, 1e-6);
}

TEST(StatisticsTest, SampleStdDevNeedsTwoValues) {
    EXPECT_FALSE(SampleStdDev({}).has_value());
    EXPECT_FALSE(SampleStdDev({3.0}).has_value());
    EXPECT_DOUBLE_EQ(SampleStdDev({5.0, 5.0, 5.0}).value(), 0.0);
}

TEST(StatisticsTest, PearsonPerfectCorrelation) {
    std::vector<double> x = {1, 2, 3, 4, 5};
    EXPECT_NEAR(PearsonCorrelation(x, {2, 4, 6, 8, 10}).value(), 1.0, 1e-12);
    EXPECT_NEAR(PearsonCorrelation(x, {10, 8, 6, 4, 2}).value(), -1.0, 1e-12);
}

TEST(StatisticsTest, PearsonDegenerateInputs) {
    EXPECT_FALSE(PearsonCorrelation({1, 2, 3}, {4, 4, 4}).has_value());
    EXPECT_FALSE(PearsonCorrelation({1, 2, 3}, {1, 2}).has_value());
    EXPECT_FALSE(PearsonCorrelation({1}, {1}).has_value());
}

TEST(StatisticsTest, Range) {
    auto range = Range({3.0, -1.0, 7.5, 2.0});
    ASSERT_TRUE(range.has_value());
    EXPECT_DOUBLE_EQ(range->min, -1.0);
    EXPECT_DOUBLE_EQ(range->max, 7.5);
    EXPECT_DOUBLE_EQ(range->span(), 8.5);
    EXPECT_FALSE(Range({}).has_value());
}

TEST(StatisticsTest, RangeRejectsNonFiniteValues) {
    EXPECT_THROW(Range({1.0, std::numeric_limits<double>::quiet_NaN()}), core::InvalidArgumentError);
    EXPECT_THROW(Range({std::numeric_limits<double>::infinity(), 2.0}), core::InvalidArgumentError);
}

} // namespace
} // namespace analysis
} // namespace loadsense
