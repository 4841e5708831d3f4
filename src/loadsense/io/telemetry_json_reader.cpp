#include "loadsense/io/telemetry_json_reader.h"
#include "loadsense/common/logger.h"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <fstream>
#include <optional>
#include <sstream>

namespace loadsense {
namespace io {

namespace {

std::optional<double> OptionalNumber(const rapidjson::Value& object, const char* key) {
    auto it = object.FindMember(key);
    if (it == object.MemberEnd() || it->value.IsNull()) {
        return std::nullopt;
    }
    if (!it->value.IsNumber()) {
        LOADSENSE_DEBUG("Ignoring non-numeric value for field {}", key);
        return std::nullopt;
    }
    return it->value.GetDouble();
}

std::optional<core::Timestamp> OptionalTimestamp(const rapidjson::Value& object) {
    auto it = object.FindMember("timestamp");
    if (it == object.MemberEnd()) {
        return std::nullopt;
    }
    if (it->value.IsInt64()) {
        return it->value.GetInt64();
    }
    if (it->value.IsNumber()) {
        return static_cast<core::Timestamp>(it->value.GetDouble());
    }
    return std::nullopt;
}

std::string StringOr(const rapidjson::Value& object, const char* key, const char* fallback) {
    auto it = object.FindMember(key);
    if (it == object.MemberEnd() || !it->value.IsString()) {
        return fallback;
    }
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

std::string ParseErrorMessage(const rapidjson::Document& doc) {
    return std::string("invalid JSON at offset ") + std::to_string(doc.GetErrorOffset()) +
           ": " + rapidjson::GetParseError_En(doc.GetParseError());
}

} // namespace

core::Result<std::vector<core::TelemetryPoint>> TelemetryJsonReader::ParseTelemetry(const std::string& json) {
    using ResultType = core::Result<std::vector<core::TelemetryPoint>>;

    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        return ResultType::error(ParseErrorMessage(doc));
    }
    if (!doc.IsArray()) {
        return ResultType::error("telemetry document must be a JSON array");
    }

    std::vector<core::TelemetryPoint> points;
    points.reserve(doc.Size());
    for (rapidjson::SizeType i = 0; i < doc.Size(); ++i) {
        const auto& item = doc[i];
        if (!item.IsObject()) {
            return ResultType::error("telemetry element " + std::to_string(i) + " is not an object");
        }

        auto timestamp = OptionalTimestamp(item);
        if (!timestamp) {
            return ResultType::error("telemetry element " + std::to_string(i) + " has no numeric timestamp");
        }

        core::TelemetryPoint point;
        point.timestamp = *timestamp;
        auto scenario = item.FindMember("scenario_name");
        if (scenario != item.MemberEnd() && scenario->value.IsString()) {
            point.scenario_name = std::string(scenario->value.GetString(), scenario->value.GetStringLength());
        }
        point.tps = OptionalNumber(item, "tps");
        point.avg_response_time = OptionalNumber(item, "avg_response_time");
        point.error_rate = OptionalNumber(item, "error_rate");
        point.vus = OptionalNumber(item, "vus");
        points.push_back(std::move(point));
    }

    return ResultType(std::move(points));
}

core::Result<std::vector<core::ResourceSeries>> TelemetryJsonReader::ParseResources(const std::string& json) {
    using ResultType = core::Result<std::vector<core::ResourceSeries>>;

    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        return ResultType::error(ParseErrorMessage(doc));
    }
    if (!doc.IsArray()) {
        return ResultType::error("resource document must be a JSON array");
    }

    std::vector<core::ResourceSeries> series;
    series.reserve(doc.Size());
    for (rapidjson::SizeType i = 0; i < doc.Size(); ++i) {
        const auto& item = doc[i];
        if (!item.IsObject()) {
            return ResultType::error("resource element " + std::to_string(i) + " is not an object");
        }

        core::ResourceSeries pod;
        pod.pod_name = StringOr(item, "pod_name", "unknown");
        pod.service_type = StringOr(item, "service_type", "unknown");

        auto data = item.FindMember("resource_data");
        if (data != item.MemberEnd() && data->value.IsArray()) {
            for (const auto& entry : data->value.GetArray()) {
                if (!entry.IsObject()) {
                    continue;
                }
                auto timestamp = OptionalTimestamp(entry);
                if (!timestamp) {
                    return ResultType::error("resource data of pod " + pod.pod_name +
                                             " has a point without numeric timestamp");
                }

                core::ResourceUsagePoint point;
                point.timestamp = *timestamp;
                auto usage = entry.FindMember("usage");
                if (usage != entry.MemberEnd() && usage->value.IsObject()) {
                    auto cpu = OptionalNumber(usage->value, "cpu_percent");
                    auto memory = OptionalNumber(usage->value, "memory_percent");
                    if (cpu && memory) {
                        point.usage = core::ResourceUsage{*cpu, *memory};
                    }
                }
                pod.points.push_back(point);
            }
        }
        series.push_back(std::move(pod));
    }

    return ResultType(std::move(series));
}

core::Result<std::string> TelemetryJsonReader::ReadFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return core::Result<std::string>::error("cannot open " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        return core::Result<std::string>::error("failed reading " + path);
    }
    return core::Result<std::string>(buffer.str());
}

} // namespace io
} // namespace loadsense
