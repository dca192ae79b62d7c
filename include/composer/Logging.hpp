/**
 * @file Logging.hpp
 * @brief Project logger
 *
 * One spdlog logger named "composer", writing to stderr. Library code logs
 * through logger(); the CLI picks the level.
 */

#ifndef COMPOSER_LOGGING_HPP
#define COMPOSER_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace composer {

/**
 * @brief The shared "composer" logger, created on first use
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the logger level from its name ("trace", "debug", "info", "warn", "error", "off")
 * @return false if the name is not a known level (level left unchanged)
 */
bool set_log_level(const std::string& level);

} // namespace composer

#endif // COMPOSER_LOGGING_HPP
