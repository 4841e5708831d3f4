#include <iostream>
#include <string>
#include <vector>

#include "loadsense/common/logger.h"
#include "loadsense/core/config.h"
#include "loadsense/core/error.h"
#include "loadsense/io/telemetry_json_reader.h"
#include "loadsense/pipeline/timeseries_processor.h"

using namespace loadsense;

namespace {

constexpr int kExitUsage = 1;
constexpr int kExitBadInput = 2;

struct Options {
    std::string performance_file;
    std::string resources_file;
    std::string log_level = "warn";
    bool remove_noise = false;
};

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--remove-noise] [--log-level LEVEL] (--performance FILE | --resources FILE)"
              << std::endl;
}

int RunPerformance(const pipeline::TimeseriesProcessor& processor, const Options& options) {
    auto contents = io::TelemetryJsonReader::ReadFile(options.performance_file);
    if (!contents.ok()) {
        std::cerr << "Read failed: " << contents.error() << std::endl;
        return kExitBadInput;
    }
    auto points = io::TelemetryJsonReader::ParseTelemetry(contents.value());
    if (!points.ok()) {
        std::cerr << "Parse failed: " << points.error() << std::endl;
        return kExitBadInput;
    }

    auto context = processor.process_performance(points.value(), options.remove_noise);
    std::cout << context.summary_text << std::endl;
    std::cout << "Cleaned points: " << context.cleaned_points.size()
              << " of " << points.value().size() << std::endl;
    return 0;
}

int RunResources(const pipeline::TimeseriesProcessor& processor, const Options& options) {
    auto contents = io::TelemetryJsonReader::ReadFile(options.resources_file);
    if (!contents.ok()) {
        std::cerr << "Read failed: " << contents.error() << std::endl;
        return kExitBadInput;
    }
    auto series = io::TelemetryJsonReader::ParseResources(contents.value());
    if (!series.ok()) {
        std::cerr << "Parse failed: " << series.error() << std::endl;
        return kExitBadInput;
    }

    auto context = processor.process_resources(series.value(), options.remove_noise);
    size_t retained = 0;
    for (const auto& pod : context.cleaned_points) {
        retained += pod.points.size();
    }
    std::cout << context.summary_text << std::endl;
    std::cout << "Cleaned points: " << retained << " across "
              << context.cleaned_points.size() << " pods" << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Options options;

    // Simple arg parsing
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--performance" && i + 1 < argc) options.performance_file = argv[++i];
        else if (arg == "--resources" && i + 1 < argc) options.resources_file = argv[++i];
        else if (arg == "--log-level" && i + 1 < argc) options.log_level = argv[++i];
        else if (arg == "--remove-noise") options.remove_noise = true;
        else {
            PrintUsage(argv[0]);
            return kExitUsage;
        }
    }

    if (options.performance_file.empty() == options.resources_file.empty()) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    common::Logger::Init();
    auto level = common::Logger::ParseLevel(options.log_level);
    if (!level) {
        std::cerr << "Unknown log level: " << options.log_level << std::endl;
        return kExitUsage;
    }
    common::Logger::SetLevel(*level);

    try {
        pipeline::TimeseriesProcessor processor(core::ProcessorConfig::Default());
        if (!options.performance_file.empty()) {
            return RunPerformance(processor, options);
        }
        return RunResources(processor, options);
    } catch (const core::Error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitUsage;
    }
}
