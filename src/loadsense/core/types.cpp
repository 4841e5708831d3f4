#include "loadsense/core/types.h"

namespace loadsense {
namespace core {

std::optional<Value> FieldValue(const TelemetryPoint& point, TelemetryField field) {
    switch (field) {
        case TelemetryField::TPS:
            return point.tps;
        case TelemetryField::AVG_RESPONSE_TIME:
            return point.avg_response_time;
        case TelemetryField::ERROR_RATE:
            return point.error_rate;
        case TelemetryField::VUS:
            return point.vus;
    }
    return std::nullopt;
}

const char* FieldName(TelemetryField field) {
    switch (field) {
        case TelemetryField::TPS:
            return "tps";
        case TelemetryField::AVG_RESPONSE_TIME:
            return "avg_response_time";
        case TelemetryField::ERROR_RATE:
            return "error_rate";
        case TelemetryField::VUS:
            return "vus";
    }
    return "unknown";
}

std::vector<Value> ExtractField(const std::vector<TelemetryPoint>& points, TelemetryField field) {
    std::vector<Value> values;
    values.reserve(points.size());
    for (const auto& point : points) {
        auto value = FieldValue(point, field);
        if (value) {
            values.push_back(*value);
        }
    }
    return values;
}

} // namespace core
} // namespace loadsense
