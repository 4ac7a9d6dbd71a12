/**
 * @file Log.hpp
 * @brief Logging for the merge library (spdlog)
 *
 * All library components log through one named spdlog logger,
 * "confmerge", writing to stderr. The default level is warn so library
 * users only see problems; the CLI raises it with -v.
 */

#ifndef CONFMERGE_LOG_HPP
#define CONFMERGE_LOG_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace confmerge {
namespace log {

/**
 * @brief Shared "confmerge" logger, created on first use
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the logger level
 */
void set_level(spdlog::level::level_enum level);

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "off")
 * @throws OptionsError for unknown names
 */
spdlog::level::level_enum parse_level(const std::string& name);

} // namespace log
} // namespace confmerge

#endif // CONFMERGE_LOG_HPP
