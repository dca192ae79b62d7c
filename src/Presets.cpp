/**
 * @file Presets.cpp
 * @brief Preset table and settings conversion
 */

#include "composer/Presets.hpp"
#include "composer/Errors.hpp"
#include "composer/Parse.hpp"

namespace composer {

void PresetTable::set(const std::string& name, ResourceLimits limits) {
    for (auto& [n, l] : entries_) {
        if (n == name) {
            l = limits;
            return;
        }
    }
    entries_.emplace_back(name, limits);
}

ResourceLimits PresetTable::resolve(const std::string& name) const {
    for (const auto& [n, l] : entries_) {
        if (n == name) return l;
    }
    throw UnknownPresetError(name, names());
}

bool PresetTable::contains(const std::string& name) const {
    for (const auto& [n, l] : entries_) {
        if (n == name) return true;
    }
    return false;
}

std::vector<std::string> PresetTable::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [n, l] : entries_) out.push_back(n);
    return out;
}

PresetTable default_presets() {
    auto limits = [](const char* cpus, const char* memory) {
        ResourceLimits r;
        r.cpu_limit = parse_cpu_quantity(cpus);
        r.memory_limit = parse_memory_quantity(memory);
        return r;
    };

    PresetTable table;
    table.set("Small", limits("0.2", "64M"));
    table.set("Medium", limits("0.5", "128M"));
    table.set("Big", limits("1", "512M"));
    return table;
}

// ---- settings form ---------------------------------------------------------
namespace {
    using nlohmann::json;

    std::string quantity_text(const std::string& preset, const json& v) {
        if (v.is_string()) return v.get<std::string>();
        if (v.is_number_integer()) return std::to_string(v.get<std::int64_t>());
        if (v.is_number_float()) return v.dump();
        throw ValidationError("preset '" + preset + "': quantity must be a string or number");
    }

    void read_pair(const std::string& preset, const json& obj,
                   std::optional<CpuQuantity>& cpu, std::optional<MemoryQuantity>& mem) {
        if (auto it = obj.find("cpus"); it != obj.end()) {
            cpu = parse_cpu_quantity(quantity_text(preset, *it));
        }
        if (auto it = obj.find("memory"); it != obj.end()) {
            mem = parse_memory_quantity(quantity_text(preset, *it));
        }
    }
} // namespace

ResourceLimits preset_from_json(const std::string& name, const nlohmann::json& j) {
    ResourceLimits limits;
    if (j.is_array()) {
        if (j.size() != 2) {
            throw ValidationError("preset '" + name + "': expected [cpus, memory]");
        }
        limits.cpu_limit = parse_cpu_quantity(quantity_text(name, j[0]));
        limits.memory_limit = parse_memory_quantity(quantity_text(name, j[1]));
        return limits;
    }
    if (!j.is_object()) {
        throw ValidationError("preset '" + name + "': expected an array or an object");
    }

    read_pair(name, j, limits.cpu_limit, limits.memory_limit);
    if (auto it = j.find("reservations"); it != j.end()) {
        if (!it->is_object()) {
            throw ValidationError("preset '" + name + "': reservations must be an object");
        }
        read_pair(name, *it, limits.cpu_reservation, limits.memory_reservation);
    }
    if (limits.empty()) {
        throw ValidationError("preset '" + name + "': no cpus or memory given");
    }
    return limits;
}

PresetTable presets_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ValidationError("presets must be a table of name -> preset");
    }
    PresetTable table;
    for (auto it = j.begin(); it != j.end(); ++it) {
        table.set(it.key(), preset_from_json(it.key(), it.value()));
    }
    return table;
}

} // namespace composer
