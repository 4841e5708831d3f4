#include <gtest/gtest.h>
#include "loadsense/analysis/correlation.h"
#include "test_util/telemetry_builders.h"

namespace loadsense {
namespace analysis {
namespace {

using testutil::MakePoint;

TEST(CorrelationAnalyzerTest, TooFewPoints) {
    std::vector<core::TelemetryPoint> points;
    for (int i = 1; i <= 9; ++i) {
        points.push_back(MakePoint(i, 10.0 * i, 1.0 * i));
    }
    CorrelationAnalyzer analyzer;
    auto result = analyzer.correlate(points);
    EXPECT_EQ(result.correlation, CorrelationStrength::INSUFFICIENT_DATA);
    EXPECT_DOUBLE_EQ(result.coefficient, 0.0);
    EXPECT_EQ(result.pattern, ScalingPattern::UNKNOWN);
}

TEST(CorrelationAnalyzerTest, PerfectLinearScaling) {
    std::vector<core::TelemetryPoint> points;
    const std::vector<double> vus = {10, 20, 30, 40, 50};
    const std::vector<double> tps = {100, 200, 300, 400, 500};
    for (size_t i = 0; i < vus.size(); ++i) {
        points.push_back(MakePoint(static_cast<core::Timestamp>(i), tps[i], vus[i]));
    }
    // Points without throughput do not form pairs
    for (size_t i = 0; i < 5; ++i) {
        points.push_back(MakePoint(static_cast<core::Timestamp>(10 + i), std::nullopt, 60.0));
    }

    CorrelationAnalyzer analyzer;
    auto result = analyzer.correlate(points);

    EXPECT_EQ(result.pairs, 5u);
    EXPECT_EQ(result.correlation, CorrelationStrength::STRONG_POSITIVE);
    EXPECT_EQ(result.pattern, ScalingPattern::LINEAR_SCALING);
    EXPECT_NEAR(result.coefficient, 1.0, 1e-9);
    EXPECT_DOUBLE_EQ(result.scaling_ratio, 10.0);
    EXPECT_DOUBLE_EQ(result.vus_range.min, 10.0);
    EXPECT_DOUBLE_EQ(result.vus_range.max, 50.0);
    EXPECT_DOUBLE_EQ(result.tps_range.min, 100.0);
    EXPECT_DOUBLE_EQ(result.tps_range.max, 500.0);
    EXPECT_TRUE(result.has_ranges());
}

TEST(CorrelationAnalyzerTest, NonPositiveValuesAreNotPairs) {
    std::vector<core::TelemetryPoint> points;
    for (int i = 0; i < 12; ++i) {
        points.push_back(MakePoint(i, i < 8 ? 0.0 : 100.0 * i, 10.0 * i));
    }
    CorrelationAnalyzer analyzer;
    auto result = analyzer.correlate(points);
    EXPECT_EQ(result.pairs, 4u);
    EXPECT_EQ(result.correlation, CorrelationStrength::INSUFFICIENT_DATA);
}

TEST(CorrelationAnalyzerTest, FlatThroughputIsBottlenecked) {
    std::vector<core::TelemetryPoint> points;
    for (int i = 0; i < 10; ++i) {
        points.push_back(MakePoint(i, i % 2 == 0 ? 100.0 : 101.0, 10.0 * (i + 1)));
    }
    CorrelationAnalyzer analyzer;
    auto result = analyzer.correlate(points);
    EXPECT_EQ(result.correlation, CorrelationStrength::NO_CORRELATION);
    EXPECT_EQ(result.pattern, ScalingPattern::BOTTLENECKED);
    EXPECT_NEAR(result.coefficient, 0.174, 0.001);
    EXPECT_DOUBLE_EQ(result.scaling_ratio, 0.01);
}

TEST(CorrelationAnalyzerTest, ConstantLoadIsCalculationError) {
    std::vector<core::TelemetryPoint> points;
    for (int i = 0; i < 10; ++i) {
        points.push_back(MakePoint(i, 100.0 + i, 50.0));
    }
    CorrelationAnalyzer analyzer;
    auto result = analyzer.correlate(points);
    EXPECT_EQ(result.correlation, CorrelationStrength::CALCULATION_ERROR);
    EXPECT_DOUBLE_EQ(result.coefficient, 0.0);
    EXPECT_FALSE(result.has_ranges());
}

TEST(CorrelationAnalyzerTest, ToStringIncludesRanges) {
    std::vector<core::TelemetryPoint> points;
    for (int i = 1; i <= 10; ++i) {
        points.push_back(MakePoint(i, 20.0 * i, 10.0 * i));
    }
    CorrelationAnalyzer analyzer;
    EXPECT_EQ(analyzer.correlate(points).to_string(),
              "correlation=strong-positive coefficient=1.000 pattern=linear-scaling "
              "scaling_ratio=2.00 vu_range=10-100 tps_range=20.0-200.0");
}

} // namespace
} // namespace analysis
} // namespace loadsense
