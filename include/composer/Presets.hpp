/**
 * @file Presets.hpp
 * @brief Named resource presets
 *
 * A preset is a shortcut for a concrete ResourceLimits value. Resolution is
 * a pure lookup: the document only ever receives the resolved quantities.
 *
 * Built-in table (limits only):
 *
 * | preset | cpus | memory |
 * |--------|------|--------|
 * | Small  | 0.2  | 64M    |
 * | Medium | 0.5  | 128M   |
 * | Big    | 1    | 512M   |
 */

#ifndef COMPOSER_PRESETS_HPP
#define COMPOSER_PRESETS_HPP

#include "composer/Resources.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace composer {

class PresetTable {
public:
    PresetTable() = default;

    /**
     * @brief Add or replace a preset; new names keep insertion order
     */
    void set(const std::string& name, ResourceLimits limits);

    /**
     * @brief Look up a preset by exact name
     * @throws UnknownPresetError if the name is not in the table
     */
    ResourceLimits resolve(const std::string& name) const;

    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;

    const std::vector<std::pair<std::string, ResourceLimits>>& entries() const noexcept {
        return entries_;
    }

    bool empty() const noexcept { return entries_.empty(); }

private:
    std::vector<std::pair<std::string, ResourceLimits>> entries_;
};

/**
 * @brief Built-in Small / Medium / Big table
 */
PresetTable default_presets();

/**
 * @brief Build one preset from its settings form
 *
 * Accepts `["0.5", "128M"]` (cpus, memory limits) or
 * `{"cpus": "0.5", "memory": "128M", "reservations": {"cpus": "0.1", "memory": "32M"}}`.
 * Numbers are accepted wherever strings are.
 *
 * @throws ValidationError for any other shape or a malformed quantity
 */
ResourceLimits preset_from_json(const std::string& name, const nlohmann::json& j);

/**
 * @brief Build a table from a settings object {name: preset, ...}
 * @throws ValidationError if `j` is not an object or an entry is malformed
 */
PresetTable presets_from_json(const nlohmann::json& j);

} // namespace composer

#endif // COMPOSER_PRESETS_HPP
