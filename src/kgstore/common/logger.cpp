#include "kgstore/common/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <iostream>

namespace kgstore {
namespace common {

void Logger::Init(spdlog::level::level_enum level) {
    try {
        auto console = spdlog::get(kName);
        if (!console) {
            console = spdlog::stdout_color_mt(kName);
            console->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v");
        }
        spdlog::set_default_logger(console);
        spdlog::set_level(level);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "kgstore log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

core::Result<spdlog::level::level_enum> Logger::ParseLevel(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return spdlog::level::trace;
    if (lowered == "debug") return spdlog::level::debug;
    if (lowered == "info") return spdlog::level::info;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error") return spdlog::level::err;
    if (lowered == "critical") return spdlog::level::critical;
    if (lowered == "off") return spdlog::level::off;
    return core::InvalidArgumentError("Unknown log level: " + name);
}

} // namespace common
} // namespace kgstore
