#ifndef LOADSENSE_CORE_TYPES_H_
#define LOADSENSE_CORE_TYPES_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace loadsense {
namespace core {

/**
 * @brief Represents a timestamp in milliseconds since Unix epoch
 */
using Timestamp = int64_t;

/**
 * @brief Represents a metric value
 */
using Value = double;

/**
 * @brief One sample of aggregate or per-scenario load test performance
 *
 * A sample without a scenario name is an aggregate (overall) sample.
 * Absent metrics are excluded from the statistic they would feed.
 */
struct TelemetryPoint {
    Timestamp timestamp = 0;
    std::optional<std::string> scenario_name;
    std::optional<Value> tps;
    std::optional<Value> avg_response_time;
    std::optional<Value> error_rate;
    std::optional<Value> vus;

    bool is_aggregate() const { return !scenario_name.has_value(); }
};

/**
 * @brief Numeric fields of a TelemetryPoint that can key a statistic
 */
enum class TelemetryField {
    TPS,
    AVG_RESPONSE_TIME,
    ERROR_RATE,
    VUS
};

std::optional<Value> FieldValue(const TelemetryPoint& point, TelemetryField field);
const char* FieldName(TelemetryField field);

/**
 * @brief Extract the present values of a field, in sequence order
 */
std::vector<Value> ExtractField(const std::vector<TelemetryPoint>& points, TelemetryField field);

struct ResourceUsage {
    Value cpu_percent = 0.0;
    Value memory_percent = 0.0;
};

/**
 * @brief One resource utilization reading of a pod
 */
struct ResourceUsagePoint {
    Timestamp timestamp = 0;
    std::optional<ResourceUsage> usage;
};

/**
 * @brief Per-pod resource trace
 */
struct ResourceSeries {
    std::string pod_name;
    std::string service_type;
    std::vector<ResourceUsagePoint> points;
};

/**
 * @brief Output of a pipeline run: cleaned records plus the report text
 */
template<typename Record>
struct AnalysisContext {
    std::vector<Record> cleaned_points;
    std::string summary_text;
};

using PerformanceContext = AnalysisContext<TelemetryPoint>;
using ResourceContext = AnalysisContext<ResourceSeries>;

} // namespace core
} // namespace loadsense

#endif // LOADSENSE_CORE_TYPES_H_
