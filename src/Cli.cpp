/**
 * @file Cli.cpp
 * @brief compose-manager option handling and text output
 */

#include "composer/Cli.hpp"
#include "composer/Errors.hpp"
#include "composer/Logging.hpp"
#include "composer/Parse.hpp"
#include "composer/Util.hpp"

#include <sstream>

namespace composer {

namespace {

template <typename T, typename Parser>
std::optional<std::vector<T>> parse_all(const std::vector<std::string>& texts, Parser parse) {
    if (texts.empty()) return std::nullopt;
    std::vector<T> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        out.push_back(parse(text));
    }
    return out;
}

std::string join_pairs(const KeyValueList& kv) {
    std::vector<std::string> parts;
    for (const auto& [key, value] : kv) {
        parts.push_back(key + "=" + value);
    }
    return join(parts, ", ");
}

template <typename T>
std::string join_strings(const std::vector<T>& items) {
    std::vector<std::string> parts;
    for (const auto& item : items) {
        parts.push_back(item.to_string());
    }
    return join(parts, ", ");
}

std::string quantities(const std::optional<CpuQuantity>& cpus,
                       const std::optional<MemoryQuantity>& memory) {
    std::vector<std::string> parts;
    if (cpus) parts.push_back("cpus " + cpus->to_string());
    if (memory) parts.push_back("memory " + memory->to_string());
    return join(parts, ", ");
}

nlohmann::json quantities_json(const std::optional<CpuQuantity>& cpus,
                               const std::optional<MemoryQuantity>& memory) {
    nlohmann::json j = nlohmann::json::object();
    if (cpus) j["cpus"] = cpus->to_string();
    if (memory) j["memory"] = memory->to_string();
    return j;
}

} // namespace

// ============================================================================
// build
// ============================================================================

ComposeDocument build_document(const BuildOptions& opts, const PresetTable& presets) {
    ComposeDocument doc;

    for (const auto& text : opts.new_networks) {
        doc.add_network(parse_network_option(text));
    }
    for (const auto& name : opts.external_networks) {
        NetworkSpec net(trim(name));
        net.external = true;
        doc.add_network(std::move(net));
    }
    for (const auto& name : opts.internal_networks) {
        NetworkSpec net(trim(name));
        net.internal = true;
        doc.add_network(std::move(net));
    }

    if (opts.container_name && opts.services.size() != 1) {
        throw ValidationError("a container name can only be given for a single service");
    }

    // Fields shared by every service of this invocation
    ServiceSpec shared;
    if (opts.restart) {
        shared.restart = parse_restart_policy(*opts.restart);
        if (!shared.restart) {
            throw ValidationError("invalid restart policy '" + *opts.restart +
                                  "': expected always, unless-stopped, on-failure or no");
        }
    }
    if (!opts.networks.empty()) shared.networks = opts.networks;
    if (!opts.depends_on.empty()) shared.depends_on = opts.depends_on;
    shared.ports = parse_all<PortMapping>(opts.ports, parse_port_mapping);
    shared.volumes = parse_all<VolumeMapping>(opts.volumes, parse_volume_mapping);
    shared.environment = parse_all<std::pair<std::string, std::string>>(opts.environment,
                                                                        parse_env_assignment);
    shared.labels = parse_all<std::pair<std::string, std::string>>(opts.labels,
                                                                   parse_label_assignment);

    if (opts.preset || opts.cpus || opts.memory) {
        ResourceLimits limits;
        if (opts.preset && opts.cpus && opts.memory) {
            // An unknown preset is not fatal when both limits are given
            try {
                limits = presets.resolve(*opts.preset);
            } catch (const UnknownPresetError& e) {
                logger()->warn("{}; using the given cpus and memory", e.what());
            }
        } else if (opts.preset) {
            limits = presets.resolve(*opts.preset);
        }
        if (opts.cpus) limits.cpu_limit = parse_cpu_quantity(*opts.cpus);
        if (opts.memory) limits.memory_limit = parse_memory_quantity(*opts.memory);
        shared.resources = limits;
    }
    shared.auto_update = opts.auto_update;
    shared.notes = opts.notes;

    for (const auto& text : opts.services) {
        auto [name, image] = parse_service_image(text);
        ServiceSpec svc = shared;
        svc.name = name;
        if (!image.empty()) svc.image = image;
        svc.container_name = opts.container_name;
        doc.add_service(std::move(svc));
    }
    return doc;
}

// ============================================================================
// Output
// ============================================================================

std::string describe(const ResourceLimits& limits) {
    std::string out = quantities(limits.cpu_limit, limits.memory_limit);
    if (limits.has_reservations()) {
        if (!out.empty()) out += " ";
        out += "(reserved: " + quantities(limits.cpu_reservation, limits.memory_reservation) + ")";
    }
    return out;
}

nlohmann::json to_json(const ComposeDocument& doc) {
    nlohmann::json services = nlohmann::json::object();
    for (const auto& svc : doc.services()) {
        nlohmann::json j = nlohmann::json::object();
        if (svc.container_name) j["container_name"] = *svc.container_name;
        if (svc.image) j["image"] = *svc.image;
        if (svc.restart) j["restart"] = to_string(*svc.restart);
        if (svc.networks) j["networks"] = *svc.networks;
        if (svc.ports) {
            j["ports"] = nlohmann::json::array();
            for (const auto& p : *svc.ports) j["ports"].push_back(p.to_string());
        }
        if (svc.environment) {
            j["environment"] = nlohmann::json::object();
            for (const auto& [key, value] : *svc.environment) j["environment"][key] = value;
        }
        if (svc.volumes) {
            j["volumes"] = nlohmann::json::array();
            for (const auto& v : *svc.volumes) j["volumes"].push_back(v.to_string());
        }
        if (svc.depends_on) j["depends_on"] = *svc.depends_on;
        if (svc.labels) {
            j["labels"] = nlohmann::json::object();
            for (const auto& [key, value] : *svc.labels) j["labels"][key] = value;
        }
        if (svc.resources) {
            nlohmann::json res = nlohmann::json::object();
            if (svc.resources->has_limits()) {
                res["limits"] = quantities_json(svc.resources->cpu_limit, svc.resources->memory_limit);
            }
            if (svc.resources->has_reservations()) {
                res["reservations"] = quantities_json(svc.resources->cpu_reservation,
                                                      svc.resources->memory_reservation);
            }
            j["resources"] = res;
        }
        if (svc.auto_update) j["auto_update"] = *svc.auto_update;
        services[svc.name] = j;
    }

    nlohmann::json networks = nlohmann::json::object();
    for (const auto& net : doc.networks()) {
        nlohmann::json j = nlohmann::json::object();
        if (net.network_name) j["name"] = *net.network_name;
        if (net.driver) j["driver"] = to_string(*net.driver);
        if (net.external) j["external"] = *net.external;
        if (net.internal) j["internal"] = *net.internal;
        if (net.enable_ipv6) j["enable_ipv6"] = *net.enable_ipv6;
        networks[net.name] = j;
    }

    return {{"services", services}, {"networks", networks}};
}

std::string format_listing(const ComposeDocument& doc) {
    std::ostringstream out;

    out << "services:";
    if (doc.services().empty()) out << " (none)";
    out << "\n";
    for (const auto& svc : doc.services()) {
        out << "  " << svc.name << "\n";
        if (svc.container_name) out << "    container_name: " << *svc.container_name << "\n";
        if (svc.image) out << "    image: " << *svc.image << "\n";
        if (svc.restart) out << "    restart: " << to_string(*svc.restart) << "\n";
        if (svc.networks) out << "    networks: " << join(*svc.networks, ", ") << "\n";
        if (svc.ports) out << "    ports: " << join_strings(*svc.ports) << "\n";
        if (svc.environment) out << "    environment: " << join_pairs(*svc.environment) << "\n";
        if (svc.volumes) out << "    volumes: " << join_strings(*svc.volumes) << "\n";
        if (svc.depends_on) out << "    depends_on: " << join(*svc.depends_on, ", ") << "\n";
        if (svc.labels && !svc.labels->empty()) out << "    labels: " << join_pairs(*svc.labels) << "\n";
        if (svc.resources) out << "    resources: " << describe(*svc.resources) << "\n";
        if (svc.auto_update) out << "    auto_update: " << (*svc.auto_update ? "true" : "false") << "\n";
    }

    out << "networks:";
    if (doc.networks().empty()) out << " (none)";
    out << "\n";
    for (const auto& net : doc.networks()) {
        out << "  " << net.name << "\n";
        if (net.network_name) out << "    name: " << *net.network_name << "\n";
        if (net.driver) out << "    driver: " << to_string(*net.driver) << "\n";
        if (net.external) out << "    external: " << (*net.external ? "true" : "false") << "\n";
        if (net.internal) out << "    internal: " << (*net.internal ? "true" : "false") << "\n";
        if (net.enable_ipv6) out << "    enable_ipv6: " << (*net.enable_ipv6 ? "true" : "false") << "\n";
    }
    return out.str();
}

std::string format_presets(const PresetTable& presets) {
    std::ostringstream out;
    for (const auto& [name, limits] : presets.entries()) {
        out << name << ": " << describe(limits) << "\n";
    }
    return out.str();
}

std::string format_report(const MergeReport& report) {
    std::ostringstream out;
    for (const auto& name : report.networks_added) out << "Added network " << name << "\n";
    for (const auto& name : report.networks_updated) out << "Updated network " << name << "\n";
    for (const auto& name : report.services_added) out << "Added service " << name << "\n";
    for (const auto& name : report.services_updated) out << "Updated service " << name << "\n";
    if (!report.changed()) out << "No changes\n";
    return out.str();
}

} // namespace composer
