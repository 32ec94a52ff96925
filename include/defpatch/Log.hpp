/**
 * @file Log.hpp
 * @brief Default logger setup
 *
 * All library code logs through the spdlog default logger. The CLI calls
 * configure_logging() once with the effective `log.level` and
 * `log.pattern` settings; library users may install their own logger
 * instead.
 */

#ifndef DEFPATCH_LOG_HPP
#define DEFPATCH_LOG_HPP

#include <spdlog/common.h>
#include <string>

namespace defpatch {

/**
 * @brief Map a level name to an spdlog level
 *
 * Accepts trace, debug, info, warn/warning, error/err, critical, off
 * (case-insensitive).
 *
 * @throws ConfigError for an unknown name
 */
spdlog::level::level_enum parse_log_level(const std::string& name);

/**
 * @brief Install a stderr colour logger as the spdlog default
 * @param level Level name, see parse_log_level()
 * @param pattern spdlog pattern; empty keeps spdlog's default
 * @throws ConfigError for an unknown level
 */
void configure_logging(const std::string& level, const std::string& pattern = "");

} // namespace defpatch

#endif // DEFPATCH_LOG_HPP
