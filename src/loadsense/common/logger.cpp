#include "loadsense/common/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <iostream>

namespace loadsense {
namespace common {

void Logger::Init() {
    try {
        auto console = spdlog::get("console");
        if (!console) {
            console = spdlog::stdout_color_mt("console");
        }
        spdlog::set_default_logger(console);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
        spdlog::set_level(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

std::optional<spdlog::level::level_enum> Logger::ParseLevel(const std::string& name) {
    std::string normalized(name);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (normalized == "trace") return spdlog::level::trace;
    if (normalized == "debug") return spdlog::level::debug;
    if (normalized == "info") return spdlog::level::info;
    if (normalized == "warn" || normalized == "warning") return spdlog::level::warn;
    if (normalized == "error") return spdlog::level::err;
    if (normalized == "critical") return spdlog::level::critical;
    if (normalized == "off") return spdlog::level::off;
    return std::nullopt;
}

} // namespace common
} // namespace loadsense
