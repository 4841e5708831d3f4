#ifndef LOADSENSE_IO_TELEMETRY_JSON_READER_H_
#define LOADSENSE_IO_TELEMETRY_JSON_READER_H_

#include <string>
#include <vector>

#include "loadsense/core/result.h"
#include "loadsense/core/types.h"

namespace loadsense {
namespace io {

/**
 * @brief Decodes telemetry and resource records from JSON documents
 *
 * Performance document: an array of objects with an integer "timestamp"
 * (epoch milliseconds), an optional "scenario_name" and optional numeric
 * "tps", "avg_response_time", "error_rate" and "vus". null or non-numeric
 * values count as absent.
 *
 * Resource document: an array of objects with "pod_name", "service_type"
 * and "resource_data": [{"timestamp", "usage": {"cpu_percent",
 * "memory_percent"}}]. Missing names default to "unknown".
 */
class TelemetryJsonReader {
public:
    static core::Result<std::vector<core::TelemetryPoint>> ParseTelemetry(const std::string& json);
    static core::Result<std::vector<core::ResourceSeries>> ParseResources(const std::string& json);

    /**
     * @brief Read a whole file into memory
     */
    static core::Result<std::string> ReadFile(const std::string& path);
};

} // namespace io
} // namespace loadsense

#endif // LOADSENSE_IO_TELEMETRY_JSON_READER_H_
