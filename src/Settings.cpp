/**
 * @file Settings.cpp
 * @brief Settings loading (JSON via nlohmann::json, TOML via toml++)
 */

#include "composer/Settings.hpp"
#include "composer/Errors.hpp"
#include "composer/Logging.hpp"
#include "composer/Util.hpp"

#include <toml++/toml.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace composer {

namespace {

using nlohmann::json;

json toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return json(node.as_string()->get());

        case toml::node_type::integer:
            return json(node.as_integer()->get());

        case toml::node_type::floating_point:
            return json(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return json(node.as_boolean()->get());

        case toml::node_type::array: {
            json arr = json::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            json obj = json::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return json(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return json(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return json(ss.str());
        }

        default:
            return json(nullptr);
    }
}

json load_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ParseError(path, 0, 0, "cannot open file");
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    try {
        return json::parse(ss.str());
    } catch (const json::parse_error& e) {
        throw ParseError(path, 0, 0, e.what());
    }
}

json load_toml_file(const std::string& path) {
    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw ParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
    return toml_value_to_json(table);
}

std::string string_setting(const json& data, const char* key, const std::string& fallback) {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) return fallback;
    if (!it->is_string()) {
        throw ValidationError(std::string("setting '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

} // namespace

json read_settings_file(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = to_lower(fs::path(path).extension().string());
    json data;
    if (ext == ".json") {
        data = load_json_file(path);
    } else if (ext == ".toml") {
        data = load_toml_file(path);
    } else {
        throw ParseError(path, 0, 0, "unsupported settings format '" + ext + "' (use .json or .toml)");
    }

    if (!data.is_object()) {
        throw ParseError(path, 0, 0, "settings root must be a table/object");
    }
    return data;
}

std::string default_settings_path() {
    return expand_user("~/.compose_manager.toml");
}

Settings load_settings(const SettingsOptions& opts) {
    Settings defaults;

    // 1) defaults
    json merged = {
        {"infra_file", defaults.infra_file},
        {"log_level", defaults.log_level},
    };

    // 2) file
    if (opts.file_path.has_value()) {
        deep_merge(merged, read_settings_file(*opts.file_path));
        logger()->debug("settings read from {}", *opts.file_path);
    }

    // 3) env
    if (!opts.env_prefix.empty()) {
        if (auto v = get_env_var(opts.env_prefix + "_INFRA_FILE")) merged["infra_file"] = *v;
        if (auto v = get_env_var(opts.env_prefix + "_LOG_LEVEL")) merged["log_level"] = *v;
    }

    // 4) overrides
    deep_merge(merged, opts.overrides);

    Settings settings;
    settings.infra_file = string_setting(merged, "infra_file", defaults.infra_file);
    settings.log_level = string_setting(merged, "log_level", defaults.log_level);
    if (auto it = merged.find("presets"); it != merged.end() && !it->is_null()) {
        settings.presets = presets_from_json(*it);
    }
    return settings;
}

} // namespace composer
