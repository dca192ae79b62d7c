/**
 * @file Cli.hpp
 * @brief Building blocks of the compose-manager command line
 *
 * Turns option values into a ComposeDocument and renders documents, presets
 * and merge reports as text. Kept out of cli_main.cpp so they can be tested
 * without running the binary.
 */

#ifndef COMPOSER_CLI_HPP
#define COMPOSER_CLI_HPP

#include "composer/Merge.hpp"
#include "composer/Presets.hpp"
#include "composer/Spec.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace composer {

/**
 * @brief Raw option values of `compose-manager build`
 *
 * Every per-service option applies to each `services` entry.
 */
struct BuildOptions {
    std::vector<std::string> services;          ///< `name:image`
    std::optional<std::string> container_name;  ///< only with a single service
    std::optional<std::string> restart;
    std::vector<std::string> networks;          ///< attach services to these
    std::vector<std::string> new_networks;      ///< `name[:driver]`
    std::vector<std::string> external_networks;
    std::vector<std::string> internal_networks;
    std::vector<std::string> ports;
    std::vector<std::string> environment;       ///< `KEY=VALUE`
    std::vector<std::string> volumes;
    std::vector<std::string> labels;            ///< `KEY=VALUE`
    std::vector<std::string> depends_on;
    std::optional<std::string> preset;
    std::optional<std::string> cpus;            ///< overrides the preset's cpu limit
    std::optional<std::string> memory;          ///< overrides the preset's memory limit
    std::optional<bool> auto_update;
    std::vector<std::string> notes;
};

/**
 * @brief Build the document a `build` invocation asks for
 *
 * Options that were not given stay unset in every ServiceSpec, so the merge
 * leaves the matching keys of existing services alone.
 *
 * @throws ValidationError for malformed option values or a container name
 *         given for more than one service
 * @throws UnknownPresetError if `preset` is not in `presets`, unless both
 *         `cpus` and `memory` are given (then only a warning is logged)
 */
ComposeDocument build_document(const BuildOptions& opts, const PresetTable& presets);

/**
 * @brief `{"services": {...}, "networks": {...}}` for `list --json`
 */
nlohmann::json to_json(const ComposeDocument& doc);

/**
 * @brief Indented plain-text listing for `list`
 */
std::string format_listing(const ComposeDocument& doc);

/**
 * @brief One line per preset: `Small: cpus 0.2, memory 64M`
 */
std::string format_presets(const PresetTable& presets);

/**
 * @brief One line per added/updated entity, or "No changes"
 */
std::string format_report(const MergeReport& report);

/**
 * @brief `cpus 0.5, memory 128M (reserved: cpus 0.1)`
 */
std::string describe(const ResourceLimits& limits);

} // namespace composer

#endif // COMPOSER_CLI_HPP
