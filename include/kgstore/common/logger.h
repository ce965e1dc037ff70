#ifndef KGSTORE_COMMON_LOGGER_H_
#define KGSTORE_COMMON_LOGGER_H_

#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

#include "kgstore/core/result.h"

namespace kgstore {
namespace common {

/**
 * @brief Process-wide logging setup for the store
 *
 * The library never installs a logger itself; until the host calls Init()
 * the KGSTORE_* macros go to whatever spdlog default logger is in place.
 * Pool growth, maintenance passes and cache evictions log at debug or info;
 * failed operations log at warn or error.
 */
class Logger {
public:
    static constexpr const char* kName = "kgstore";

    /**
     * @brief Registers a colored stdout logger named "kgstore" as the spdlog default
     *
     * Safe to call more than once; later calls only change the level.
     */
    static void Init(spdlog::level::level_enum level = spdlog::level::info);

    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Maps "trace", "debug", "info", "warn", "error", "critical" or "off"
     * (any case) to a level, for hosts that read it from the environment
     */
    static core::Result<spdlog::level::level_enum> ParseLevel(const std::string& name);
};

} // namespace common
} // namespace kgstore

#define KGSTORE_TRACE(...) spdlog::trace(__VA_ARGS__)
#define KGSTORE_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define KGSTORE_INFO(...)  spdlog::info(__VA_ARGS__)
#define KGSTORE_WARN(...)  spdlog::warn(__VA_ARGS__)
#define KGSTORE_ERROR(...) spdlog::error(__VA_ARGS__)
#define KGSTORE_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // KGSTORE_COMMON_LOGGER_H_
