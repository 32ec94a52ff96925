/**
 * @file Log.cpp
 * @brief spdlog default logger configuration
 */

#include "defpatch/Log.hpp"
#include "defpatch/Errors.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>

namespace defpatch {

spdlog::level::level_enum parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error" || lower == "err") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;

    throw ConfigError("Unknown log level '" + name +
                      "' (expected trace, debug, info, warn, error, critical or off)");
}

void configure_logging(const std::string& level, const std::string& pattern) {
    const auto lvl = parse_log_level(level);

    auto logger = spdlog::get("defpatch");
    if (!logger) {
        logger = spdlog::stderr_color_mt("defpatch");
    }
    logger->set_level(lvl);
    if (!pattern.empty()) {
        logger->set_pattern(pattern);
    }
    spdlog::set_default_logger(logger);
}

} // namespace defpatch
