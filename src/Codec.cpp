/**
 * @file Codec.cpp
 * @brief Compose YAML values to and from the service and network model
 */

#include "composer/Codec.hpp"
#include "composer/Document.hpp"
#include "composer/Errors.hpp"
#include "composer/Logging.hpp"
#include "composer/Parse.hpp"
#include "composer/Util.hpp"

#include <algorithm>

namespace composer {

namespace {

// Indexing a missing key gives an invalid node that throws when inspected;
// absent keys read as null here.
YAML::Node child(const YAML::Node& node, const std::string& key) {
    if (!node.IsMap()) return YAML::Node();
    const YAML::Node value = node[key];
    return value.IsDefined() ? value : YAML::Node();
}

bool has_key(const YAML::Node& node, const std::string& key) {
    return node.IsMap() && node[key].IsDefined();
}

std::optional<std::string> scalar_of(const YAML::Node& node) {
    if (node.IsScalar()) return node.Scalar();
    return std::nullopt;
}

// Mapping values: null reads as an empty string (`KEY:`)
std::string value_text(const YAML::Node& node) {
    return node.IsScalar() ? node.Scalar() : std::string();
}

std::optional<PortMapping> decode_port(const YAML::Node& item, const std::string& where) {
    if (item.IsScalar()) {
        try {
            return parse_port_mapping(item.Scalar());
        } catch (const ValidationError& e) {
            logger()->warn("{}: skipping port: {}", where, e.what());
            return std::nullopt;
        }
    }
    if (item.IsMap()) {
        auto target = scalar_of(child(item, "target"));
        if (!target) {
            logger()->warn("{}: skipping long-syntax port without target", where);
            return std::nullopt;
        }
        PortMapping port;
        port.container = *target;
        port.protocol = to_lower(scalar_of(child(item, "protocol")).value_or(""));
        std::string published = scalar_of(child(item, "published")).value_or("");
        auto host_ip = scalar_of(child(item, "host_ip"));
        port.host = host_ip ? *host_ip + ":" + published : published;
        return port;
    }
    logger()->warn("{}: skipping port entry that is neither text nor mapping", where);
    return std::nullopt;
}

std::optional<VolumeMapping> decode_volume(const YAML::Node& item, const std::string& where) {
    if (item.IsScalar()) {
        try {
            return parse_volume_mapping(item.Scalar());
        } catch (const ValidationError& e) {
            logger()->warn("{}: skipping volume: {}", where, e.what());
            return std::nullopt;
        }
    }
    if (item.IsMap()) {
        auto target = scalar_of(child(item, "target"));
        if (!target) {
            logger()->warn("{}: skipping long-syntax volume without target", where);
            return std::nullopt;
        }
        VolumeMapping vol;
        vol.target = *target;
        vol.source = scalar_of(child(item, "source")).value_or("");
        if (decode_bool(child(item, "read_only")).value_or(false)) vol.mode = "ro";
        return vol;
    }
    logger()->warn("{}: skipping volume entry that is neither text nor mapping", where);
    return std::nullopt;
}

void decode_quantities(const YAML::Node& group, const std::string& where,
                       std::optional<CpuQuantity>& cpus, std::optional<MemoryQuantity>& memory) {
    if (!group.IsMap()) return;
    try {
        if (auto text = scalar_of(child(group, "cpus"))) cpus = parse_cpu_quantity(*text);
        if (auto text = scalar_of(child(group, "memory"))) memory = parse_memory_quantity(*text);
    } catch (const ValidationError& e) {
        logger()->warn("{}: ignoring resource value: {}", where, e.what());
    }
}

} // namespace

// ============================================================================
// Decoding
// ============================================================================

std::optional<bool> decode_bool(const YAML::Node& node) {
    if (!node.IsScalar()) return std::nullopt;
    const std::string word = to_lower(node.Scalar());
    if (word == "true" || word == "yes" || word == "on") return true;
    if (word == "false" || word == "no" || word == "off") return false;
    return std::nullopt;
}

KeyValueList decode_key_values(const YAML::Node& node, const std::string& where) {
    KeyValueList result;
    if (node.IsSequence()) {
        for (const auto& item : node) {
            if (!item.IsScalar()) {
                logger()->warn("{}: skipping non-text list item", where);
                continue;
            }
            const std::string& text = item.Scalar();
            auto eq = text.find('=');
            if (eq == std::string::npos) {
                result.emplace_back(text, "");
            } else {
                result.emplace_back(text.substr(0, eq), text.substr(eq + 1));
            }
        }
    } else if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (!it->first.IsScalar()) continue;
            result.emplace_back(it->first.Scalar(), value_text(it->second));
        }
    } else if (node.IsDefined() && !node.IsNull()) {
        logger()->warn("{}: expected a list or mapping", where);
    }
    return result;
}

std::vector<std::string> decode_name_list(const YAML::Node& node, const std::string& where) {
    std::vector<std::string> result;
    if (node.IsSequence()) {
        for (const auto& item : node) {
            if (item.IsScalar()) {
                result.push_back(item.Scalar());
            } else {
                logger()->warn("{}: skipping non-text list item", where);
            }
        }
    } else if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (it->first.IsScalar()) result.push_back(it->first.Scalar());
        }
    } else if (node.IsDefined() && !node.IsNull()) {
        logger()->warn("{}: expected a list or mapping", where);
    }
    return result;
}

ServiceSpec decode_service(const std::string& name, const YAML::Node& node) {
    ServiceSpec svc(name);
    if (!node.IsMap()) {
        if (!node.IsNull()) logger()->warn("service '{}' is not a mapping", name);
        return svc;
    }
    const std::string where = "service '" + name + "'";

    svc.container_name = scalar_of(child(node, "container_name"));
    svc.image = scalar_of(child(node, "image"));

    if (auto text = scalar_of(child(node, "restart"))) {
        svc.restart = parse_restart_policy(*text);
        if (!svc.restart) logger()->warn("{}: unknown restart policy '{}'", where, *text);
    }

    if (has_key(node, "networks")) {
        svc.networks = decode_name_list(child(node, "networks"), where + " networks");
    }
    if (has_key(node, "depends_on")) {
        svc.depends_on = decode_name_list(child(node, "depends_on"), where + " depends_on");
    }

    if (child(node, "ports").IsSequence()) {
        std::vector<PortMapping> ports;
        for (const auto& item : child(node, "ports")) {
            if (auto port = decode_port(item, where)) ports.push_back(*port);
        }
        svc.ports = std::move(ports);
    }

    if (child(node, "volumes").IsSequence()) {
        std::vector<VolumeMapping> volumes;
        for (const auto& item : child(node, "volumes")) {
            if (auto vol = decode_volume(item, where)) volumes.push_back(*vol);
        }
        svc.volumes = std::move(volumes);
    }

    if (has_key(node, "environment")) {
        svc.environment = decode_key_values(child(node, "environment"), where + " environment");
    }

    if (has_key(node, "labels")) {
        KeyValueList labels;
        for (auto& kv : decode_key_values(child(node, "labels"), where + " labels")) {
            if (kv.first == kAutoUpdateLabel) {
                YAML::Node flag(kv.second);
                svc.auto_update = decode_bool(flag);
                if (!svc.auto_update) {
                    logger()->warn("{}: '{}' has value '{}', expected true or false", where,
                                   kAutoUpdateLabel, kv.second);
                }
                continue;
            }
            labels.push_back(std::move(kv));
        }
        svc.labels = std::move(labels);
    }

    const YAML::Node resources = child(child(node, "deploy"), "resources");
    if (resources.IsMap()) {
        ResourceLimits limits;
        decode_quantities(child(resources, "limits"), where, limits.cpu_limit, limits.memory_limit);
        decode_quantities(child(resources, "reservations"), where, limits.cpu_reservation,
                          limits.memory_reservation);
        if (!limits.empty()) svc.resources = limits;
    }

    return svc;
}

NetworkSpec decode_network(const std::string& name, const YAML::Node& node) {
    NetworkSpec net(name);
    if (!node.IsMap()) {
        if (!node.IsNull()) logger()->warn("network '{}' is not a mapping", name);
        return net;
    }

    net.network_name = scalar_of(child(node, "name"));
    if (auto text = scalar_of(child(node, "driver"))) {
        net.driver = parse_network_driver(*text);
        if (!net.driver) logger()->debug("network '{}': driver '{}' not modelled", name, *text);
    }

    const YAML::Node external = child(node, "external");
    if (external.IsMap()) {
        // legacy `external: {name: ...}`
        net.external = true;
    } else {
        net.external = decode_bool(external);
    }
    net.internal = decode_bool(child(node, "internal"));
    net.enable_ipv6 = decode_bool(child(node, "enable_ipv6"));
    return net;
}

// ============================================================================
// Encoding
// ============================================================================

YAML::Node encode_name_list(const std::vector<std::string>& names, const YAML::Node& existing) {
    if (!existing.IsMap()) {
        YAML::Node seq(YAML::NodeType::Sequence);
        for (const auto& name : names) {
            seq.push_back(name);
        }
        return seq;
    }

    YAML::Node map(YAML::NodeType::Map);
    for (const auto& name : names) {
        const YAML::Node settings = existing[name];
        if (settings.IsDefined() && !settings.IsNull()) {
            map[name] = YAML::Clone(settings);
        } else {
            map[name] = YAML::Node(YAML::NodeType::Map);
        }
    }
    return map;
}

YAML::Node encode_key_values(const KeyValueList& values, const YAML::Node& existing) {
    if (existing.IsSequence()) {
        YAML::Node seq(YAML::NodeType::Sequence);
        for (const auto& kv : values) {
            seq.push_back(kv.first + "=" + kv.second);
        }
        return seq;
    }

    YAML::Node map(YAML::NodeType::Map);
    for (const auto& kv : values) {
        map[kv.first] = kv.second;
    }
    return map;
}

YAML::Node encode_ports(const std::vector<PortMapping>& ports) {
    YAML::Node seq(YAML::NodeType::Sequence);
    for (const auto& port : ports) {
        seq.push_back(port.to_string());
    }
    return seq;
}

YAML::Node encode_volumes(const std::vector<VolumeMapping>& volumes) {
    YAML::Node seq(YAML::NodeType::Sequence);
    for (const auto& vol : volumes) {
        seq.push_back(vol.to_string());
    }
    return seq;
}

namespace {

void put_quantities(YAML::Node& resources, const char* key,
                    const std::optional<CpuQuantity>& cpus,
                    const std::optional<MemoryQuantity>& memory) {
    if (!cpus && !memory) {
        resources.remove(key);
        return;
    }
    YAML::Node group(YAML::NodeType::Map);
    if (cpus) group["cpus"] = cpus->to_string();
    if (memory) group["memory"] = memory->to_string();
    resources[key] = group;
}

} // namespace

std::optional<YAML::Node> encode_deploy(const ResourceLimits& limits, const YAML::Node& existing) {
    YAML::Node deploy = existing.IsMap() ? YAML::Clone(existing) : YAML::Node(YAML::NodeType::Map);

    const YAML::Node current = child(existing, "resources");
    YAML::Node resources = current.IsMap() ? YAML::Clone(current) : YAML::Node(YAML::NodeType::Map);

    put_quantities(resources, "limits", limits.cpu_limit, limits.memory_limit);
    put_quantities(resources, "reservations", limits.cpu_reservation, limits.memory_reservation);

    if (resources.size() == 0) {
        deploy.remove("resources");
    } else {
        deploy["resources"] = resources;
    }
    if (deploy.size() == 0) return std::nullopt;
    return deploy;
}

YAML::Node encode_bool(bool value) {
    return plain_scalar(value ? "true" : "false");
}

// ============================================================================
// Comparison
// ============================================================================

bool same_mapping(const KeyValueList& a, const KeyValueList& b) {
    KeyValueList left = a;
    KeyValueList right = b;
    std::sort(left.begin(), left.end());
    std::sort(right.begin(), right.end());
    return left == right;
}

} // namespace composer
