#ifndef LOADSENSE_COMMON_LOGGER_H_
#define LOADSENSE_COMMON_LOGGER_H_

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

#include <optional>
#include <string>

namespace loadsense {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Map a level name (trace, debug, info, warn, error, critical, off)
     * to its spdlog level
     */
    static std::optional<spdlog::level::level_enum> ParseLevel(const std::string& name);
};

} // namespace common
} // namespace loadsense

// Macros for convenient logging
#define LOADSENSE_TRACE(...) spdlog::trace(__VA_ARGS__)
#define LOADSENSE_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define LOADSENSE_INFO(...)  spdlog::info(__VA_ARGS__)
#define LOADSENSE_WARN(...)  spdlog::warn(__VA_ARGS__)
#define LOADSENSE_ERROR(...) spdlog::error(__VA_ARGS__)
#define LOADSENSE_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // LOADSENSE_COMMON_LOGGER_H_
