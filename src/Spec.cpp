/**
 * @file Spec.cpp
 * @brief Spec model helpers and shape validation
 */

#include "composer/Spec.hpp"
#include "composer/Errors.hpp"
#include "composer/Util.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace composer {

// ============================================================================
// Enumerations
// ============================================================================

std::string to_string(RestartPolicy policy) {
    switch (policy) {
        case RestartPolicy::Always: return "always";
        case RestartPolicy::UnlessStopped: return "unless-stopped";
        case RestartPolicy::OnFailure: return "on-failure";
        case RestartPolicy::No: return "no";
    }
    return "no";
}

std::optional<RestartPolicy> parse_restart_policy(const std::string& text) {
    std::string t = to_lower(trim(text));
    if (t == "always") return RestartPolicy::Always;
    if (t == "unless-stopped") return RestartPolicy::UnlessStopped;
    if (t == "on-failure") return RestartPolicy::OnFailure;
    if (t == "no") return RestartPolicy::No;
    return std::nullopt;
}

std::string to_string(NetworkDriver driver) {
    switch (driver) {
        case NetworkDriver::Bridge: return "bridge";
        case NetworkDriver::Overlay: return "overlay";
        case NetworkDriver::Host: return "host";
        case NetworkDriver::None: return "none";
        case NetworkDriver::Macvlan: return "macvlan";
    }
    return "bridge";
}

std::optional<NetworkDriver> parse_network_driver(const std::string& text) {
    std::string t = to_lower(trim(text));
    if (t == "bridge") return NetworkDriver::Bridge;
    if (t == "overlay") return NetworkDriver::Overlay;
    if (t == "host") return NetworkDriver::Host;
    if (t == "none") return NetworkDriver::None;
    if (t == "macvlan") return NetworkDriver::Macvlan;
    return std::nullopt;
}

// ============================================================================
// Collection elements
// ============================================================================

std::string PortMapping::to_string() const {
    std::string out = host.empty() ? container : host + ":" + container;
    if (!protocol.empty()) out += "/" + protocol;
    return out;
}

std::string VolumeMapping::to_string() const {
    std::string out = source.empty() ? target : source + ":" + target;
    if (!mode.empty()) out += ":" + mode;
    return out;
}

// ============================================================================
// ComposeDocument
// ============================================================================

namespace {

template <typename Spec>
const Spec* find_by_name(const std::vector<Spec>& specs, const std::string& name) {
    for (const auto& s : specs) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

template <typename Spec>
void reject_collision(const std::vector<Spec>& specs, const std::string& name, const char* kind) {
    for (const auto& s : specs) {
        if (iequals(s.name, name)) {
            throw ValidationError(std::string(kind) + " '" + name +
                                  "' collides with '" + s.name + "'");
        }
    }
}

} // namespace

ServiceSpec& ComposeDocument::add_service(ServiceSpec service) {
    reject_collision(services_, service.name, "service");
    services_.push_back(std::move(service));
    return services_.back();
}

NetworkSpec& ComposeDocument::add_network(NetworkSpec network) {
    reject_collision(networks_, network.name, "network");
    networks_.push_back(std::move(network));
    return networks_.back();
}

const ServiceSpec* ComposeDocument::find_service(const std::string& name) const {
    return find_by_name(services_, name);
}

const NetworkSpec* ComposeDocument::find_network(const std::string& name) const {
    return find_by_name(networks_, name);
}

// ============================================================================
// Validation
// ============================================================================

bool is_valid_name(const std::string& name) {
    if (name.empty()) return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '_' || c == '-';
    });
}

namespace {

void check_unique(const std::vector<std::string>& values, const std::string& where,
                  const char* what, std::vector<std::string>& issues) {
    std::set<std::string> seen;
    for (const auto& v : values) {
        if (!seen.insert(v).second) {
            issues.push_back(where + ": duplicate " + what + " '" + v + "'");
        }
    }
}

void check_keys(const KeyValueList& kv, const std::string& where, const char* what,
                std::vector<std::string>& issues) {
    std::vector<std::string> keys;
    for (const auto& [k, v] : kv) {
        if (k.empty()) {
            issues.push_back(where + ": empty " + std::string(what) + " name");
        }
        keys.push_back(k);
    }
    check_unique(keys, where, what, issues);
}

void check_ports(const std::vector<PortMapping>& ports, const std::string& where,
                 std::vector<std::string>& issues) {
    std::set<std::string> mappings;
    std::set<std::string> bindings;
    for (const auto& p : ports) {
        if (p.container.empty()) {
            issues.push_back(where + ": port '" + p.to_string() + "' has no container port");
            continue;
        }
        std::string mapping = p.host + ":" + p.container + "/" + p.effective_protocol();
        if (!mappings.insert(mapping).second) {
            issues.push_back(where + ": duplicate port '" + p.to_string() + "'");
            continue;
        }
        if (!p.host.empty() &&
            !bindings.insert(p.host + "/" + p.effective_protocol()).second) {
            issues.push_back(where + ": host port '" + p.host + "' is published twice");
        }
    }
}

void check_service(const ServiceSpec& svc, std::vector<std::string>& issues) {
    const std::string where = "service '" + svc.name + "'";
    if (!is_valid_name(svc.name)) {
        issues.push_back("invalid service name '" + svc.name + "'");
    }
    if (svc.image && trim(*svc.image).empty()) {
        issues.push_back(where + ": image is empty");
    }
    if (svc.networks) {
        check_unique(*svc.networks, where, "network", issues);
    }
    if (svc.depends_on) {
        check_unique(*svc.depends_on, where, "dependency", issues);
        for (const auto& dep : *svc.depends_on) {
            if (dep == svc.name) issues.push_back(where + ": depends on itself");
        }
    }
    if (svc.ports) {
        check_ports(*svc.ports, where, issues);
    }
    if (svc.environment) {
        check_keys(*svc.environment, where, "environment variable", issues);
    }
    if (svc.labels) {
        check_keys(*svc.labels, where, "label", issues);
        for (const auto& [k, v] : *svc.labels) {
            if (k == kAutoUpdateLabel) {
                issues.push_back(where + ": label '" + k +
                                 "' is managed through auto_update");
            }
        }
    }
    if (svc.volumes) {
        for (const auto& v : *svc.volumes) {
            if (v.target.empty()) {
                issues.push_back(where + ": volume '" + v.to_string() + "' has no target");
            }
        }
    }
}

} // namespace

std::vector<std::string> collect_issues(const ComposeDocument& doc) {
    std::vector<std::string> issues;
    for (const auto& svc : doc.services()) {
        check_service(svc, issues);
    }
    for (const auto& net : doc.networks()) {
        if (!is_valid_name(net.name)) {
            issues.push_back("invalid network name '" + net.name + "'");
        }
    }
    return issues;
}

void validate(const ComposeDocument& doc) {
    auto issues = collect_issues(doc);
    if (!issues.empty()) throw ValidationError(std::move(issues));
}

} // namespace composer
