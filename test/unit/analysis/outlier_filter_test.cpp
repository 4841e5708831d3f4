#include <gtest/gtest.h>
#include "loadsense/analysis/outlier_filter.h"
#include "loadsense/core/error.h"
#include "test_util/telemetry_builders.h"

namespace loadsense {
namespace analysis {
namespace {

using testutil::MakePoint;
using testutil::Timestamps;
using testutil::TpsSeries;

TEST(OutlierFilterTest, ShortSeriesReturnedUnchanged) {
    OutlierFilter filter;
    auto series = TpsSeries({1.0, 1000.0, 1.0, 1.0});
    auto result = filter.filter(series, core::TelemetryField::TPS);
    EXPECT_EQ(Timestamps(result), Timestamps(series));
}

TEST(OutlierFilterTest, IdenticalValuesReturnedUnchanged) {
    OutlierFilter tight(0.01);
    auto series = TpsSeries(std::vector<double>(20, 100.0));
    EXPECT_EQ(tight.filter(series, core::TelemetryField::TPS).size(), 20u);
}

TEST(OutlierFilterTest, RemovesSpike) {
    std::vector<double> values(10, 100.0);
    values.insert(values.begin() + 5, 1000.0);
    auto series = TpsSeries(values);

    OutlierFilter filter;
    auto result = filter.filter(series, core::TelemetryField::TPS);

    ASSERT_EQ(result.size(), 10u);
    for (const auto& point : result) {
        EXPECT_DOUBLE_EQ(*point.tps, 100.0);
    }
    // Order of retained points is preserved
    EXPECT_EQ(result[4].timestamp, 4000);
    EXPECT_EQ(result[5].timestamp, 6000);
}

TEST(OutlierFilterTest, KeepsPointsMissingTheField) {
    std::vector<double> values(10, 100.0);
    values.push_back(1000.0);
    auto series = TpsSeries(values);
    series.push_back(MakePoint(20000, std::nullopt, 50.0));
    series.insert(series.begin(), MakePoint(-1000, std::nullopt));

    OutlierFilter filter;
    auto result = filter.filter(series, core::TelemetryField::TPS);

    ASSERT_EQ(result.size(), 12u);
    EXPECT_EQ(result.front().timestamp, -1000);
    EXPECT_EQ(result.back().timestamp, 20000);
}

TEST(OutlierFilterTest, TooFewPresentValuesReturnedUnchanged) {
    std::vector<core::TelemetryPoint> series;
    for (int i = 0; i < 8; ++i) {
        series.push_back(MakePoint(i, i < 3 ? std::optional<double>(i * 1000.0) : std::nullopt));
    }
    OutlierFilter filter;
    EXPECT_EQ(filter.filter(series, core::TelemetryField::TPS).size(), 8u);
}

TEST(OutlierFilterTest, FallsBackWhenEverythingRejected) {
    OutlierFilter tight(0.01);
    auto series = TpsSeries({1, 2, 3, 4, 5, 6});
    auto result = tight.filter(series, core::TelemetryField::TPS);
    EXPECT_EQ(Timestamps(result), Timestamps(series));
}

TEST(OutlierFilterTest, FiltersOnRequestedField) {
    std::vector<core::TelemetryPoint> series;
    for (int i = 0; i < 11; ++i) {
        series.push_back(MakePoint(i, 1000.0 * i, i == 7 ? 900.0 : 20.0));
    }
    OutlierFilter filter;
    auto result = filter.filter(series, core::TelemetryField::VUS);
    ASSERT_EQ(result.size(), 10u);
    for (const auto& point : result) {
        EXPECT_NE(point.timestamp, 7);
    }
}

TEST(OutlierFilterTest, RejectsInvalidParameters) {
    EXPECT_THROW(OutlierFilter(0.0), core::InvalidArgumentError);
    EXPECT_THROW(OutlierFilter(2.5, 1), core::InvalidArgumentError);
}

} // namespace
} // namespace analysis
} // namespace loadsense
