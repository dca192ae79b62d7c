/**
 * @file Settings.hpp
 * @brief User settings for compose-manager
 *
 * Precedence, lowest to highest:
 * 1. Built-in defaults (`infra_file = "infra.yml"`, `log_level = "info"`,
 *    default_presets())
 * 2. Settings file, JSON or TOML by extension
 * 3. Environment: `<PREFIX>_INFRA_FILE`, `<PREFIX>_LOG_LEVEL`
 * 4. Programmatic overrides
 *
 * A `presets` table replaces the built-in preset table entirely.
 *
 * Example TOML:
 * ```toml
 * infra_file = "/srv/infra/docker-compose.yml"
 * log_level = "debug"
 *
 * [presets]
 * Small = ["0.25", "64M"]
 *
 * [presets.Worker]
 * cpus = "2"
 * memory = "1G"
 * reservations = { cpus = "0.5", memory = "256M" }
 * ```
 */

#ifndef COMPOSER_SETTINGS_HPP
#define COMPOSER_SETTINGS_HPP

#include "composer/Presets.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace composer {

struct Settings {
    std::string infra_file = "infra.yml";
    std::string log_level = "info";
    PresetTable presets = default_presets();
};

struct SettingsOptions {
    std::optional<std::string> file_path;
    std::string env_prefix = "COMPOSER";             ///< empty disables environment lookup
    nlohmann::json overrides = nlohmann::json::object(); // final precedence
};

/**
 * @brief Load settings using defaults -> file -> env -> overrides
 * @throws FileNotFoundError if `file_path` is set and does not exist
 * @throws ParseError if the file is malformed or has an unknown extension
 * @throws ValidationError if a value has the wrong type or a preset is invalid
 */
Settings load_settings(const SettingsOptions& opts);

/**
 * @brief Read a `.json` or `.toml` settings file into JSON
 * @throws FileNotFoundError, ParseError
 */
nlohmann::json read_settings_file(const std::string& path);

/**
 * @brief `~/.compose_manager.toml`
 */
std::string default_settings_path();

} // namespace composer

#endif // COMPOSER_SETTINGS_HPP
