/**
 * @file Merge.cpp
 * @brief Implementation of the compose merge engine
 */

#include "composer/Merge.hpp"
#include "composer/Codec.hpp"
#include "composer/Errors.hpp"
#include "composer/Logging.hpp"
#include "composer/Util.hpp"

#include <algorithm>
#include <functional>
#include <optional>

namespace composer {

namespace {

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

// Existing name that differs from `name` only by case
std::optional<std::string> spelling_collision(const std::vector<std::string>& names,
                                              const std::string& name) {
    if (contains(names, name)) return std::nullopt;
    for (const auto& other : names) {
        if (iequals(other, name)) return other;
    }
    return std::nullopt;
}

void check_request(const ComposeTree& tree, const ComposeDocument& doc) {
    std::vector<std::string> issues = collect_issues(doc);

    const auto existing_services = tree.section_keys("services");
    const auto existing_networks = tree.section_keys("networks");

    for (const auto& net : doc.networks()) {
        if (auto other = spelling_collision(existing_networks, net.name)) {
            issues.push_back("network '" + net.name + "' collides with existing network '" +
                             *other + "'");
        }
    }

    for (const auto& svc : doc.services()) {
        if (auto other = spelling_collision(existing_services, svc.name)) {
            issues.push_back("service '" + svc.name + "' collides with existing service '" +
                             *other + "'");
        } else if (!contains(existing_services, svc.name) && !svc.image) {
            issues.push_back("new service '" + svc.name + "' needs an image");
        }

        if (svc.networks) {
            for (const auto& net : *svc.networks) {
                if (net == kDefaultNetwork || doc.find_network(net) ||
                    contains(existing_networks, net)) {
                    continue;
                }
                issues.push_back("service '" + svc.name + "' references unknown network '" +
                                 net + "'");
            }
        }
        if (svc.depends_on) {
            for (const auto& dep : *svc.depends_on) {
                if (doc.find_service(dep) || contains(existing_services, dep)) continue;
                issues.push_back("service '" + svc.name + "' depends on unknown service '" +
                                 dep + "'");
            }
        }
    }

    if (!issues.empty()) {
        throw ValidationError(std::move(issues));
    }
}

/**
 * @brief Edits on one service/network block, tracking whether anything changed
 */
class BlockEditor {
public:
    explicit BlockEditor(Block& block) : block_(block) {}

    YAML::Node current(const std::string& key) const {
        const Entry* entry = block_.find(key);
        return entry ? entry->to_node() : YAML::Node();
    }

    void put(const std::string& key, const YAML::Node& value) {
        block_.set(key, value);
        changed_ = true;
    }

    void drop(const std::string& key) {
        if (block_.erase(key)) {
            block_.dirty = true;
            changed_ = true;
        }
    }

    bool changed() const noexcept { return changed_; }

private:
    Block& block_;
    bool changed_ = false;
};

// Decoding skips items it cannot read; such a list never equals a requested one
bool fully_decoded(const YAML::Node& node, std::size_t decoded) {
    if (!node.IsSequence() && !node.IsMap()) return true;
    return node.size() == decoded;
}

// The managed label is written as the string "true" or "false"
bool canonical_flag(const YAML::Node& labels, const std::string& text) {
    if (text != "true" && text != "false") return false;
    if (!labels.IsMap()) return true;
    const YAML::Node raw = labels[kAutoUpdateLabel];
    if (!raw.IsDefined() || !raw.IsScalar()) return false;
    const std::string& tag = raw.Tag();
    return tag == "!" || tag.empty() || tag == "tag:yaml.org,2002:str";
}

bool apply_service(Block& block, const ServiceSpec& want) {
    const ServiceSpec have = decode_service(want.name, block.to_node());
    const std::string where = "service '" + want.name + "'";
    BlockEditor edit(block);

    if (want.container_name && want.container_name != have.container_name) {
        edit.put("container_name", YAML::Node(*want.container_name));
    }
    if (want.image && want.image != have.image) {
        edit.put("image", YAML::Node(*want.image));
    }
    if (want.restart && want.restart != have.restart) {
        edit.put("restart", YAML::Node(to_string(*want.restart)));
    }

    if (want.networks && (want.networks != have.networks ||
                          !fully_decoded(edit.current("networks"), have.networks->size()))) {
        if (want.networks->empty()) {
            edit.drop("networks");
        } else {
            edit.put("networks", encode_name_list(*want.networks, edit.current("networks")));
        }
    }

    if (want.ports && (want.ports != have.ports ||
                       !fully_decoded(edit.current("ports"), have.ports->size()))) {
        if (want.ports->empty()) {
            edit.drop("ports");
        } else {
            edit.put("ports", encode_ports(*want.ports));
        }
    }

    if (want.environment &&
        !(have.environment && same_mapping(*want.environment, *have.environment) &&
          fully_decoded(edit.current("environment"), have.environment->size()))) {
        if (want.environment->empty()) {
            edit.drop("environment");
        } else {
            edit.put("environment",
                     encode_key_values(*want.environment, edit.current("environment")));
        }
    }

    if (want.volumes && (want.volumes != have.volumes ||
                         !fully_decoded(edit.current("volumes"), have.volumes->size()))) {
        if (want.volumes->empty()) {
            edit.drop("volumes");
        } else {
            edit.put("volumes", encode_volumes(*want.volumes));
        }
    }

    if (want.depends_on && (want.depends_on != have.depends_on ||
                            !fully_decoded(edit.current("depends_on"), have.depends_on->size()))) {
        if (want.depends_on->empty()) {
            edit.drop("depends_on");
        } else {
            edit.put("depends_on", encode_name_list(*want.depends_on, edit.current("depends_on")));
        }
    }

    // Labels: the managed label follows auto_update only, and is carried
    // over untouched when auto_update is not supplied.
    const YAML::Node labels_node = edit.current("labels");
    std::optional<std::string> managed;
    KeyValueList plain_labels;
    for (auto& kv : decode_key_values(labels_node, where + " labels")) {
        if (kv.first == kAutoUpdateLabel) {
            managed = kv.second;
        } else {
            plain_labels.push_back(std::move(kv));
        }
    }
    const std::size_t decoded_labels = plain_labels.size() + (managed ? 1 : 0);
    const bool labels_changed = want.labels && (!same_mapping(*want.labels, plain_labels) ||
                                                !fully_decoded(labels_node, decoded_labels));
    const bool flag_changed = want.auto_update &&
                              (want.auto_update != have.auto_update || !managed ||
                               !canonical_flag(labels_node, *managed));
    if (labels_changed || flag_changed) {
        KeyValueList labels = want.labels ? *want.labels : plain_labels;
        if (want.auto_update) {
            labels.emplace_back(kAutoUpdateLabel, *want.auto_update ? "true" : "false");
        } else if (managed) {
            labels.emplace_back(kAutoUpdateLabel, *managed);
        }
        if (labels.empty()) {
            edit.drop("labels");
        } else {
            edit.put("labels", encode_key_values(labels, labels_node));
        }
    }

    if (want.resources && *want.resources != have.resources.value_or(ResourceLimits{})) {
        auto deploy = encode_deploy(*want.resources, edit.current("deploy"));
        if (deploy) {
            edit.put("deploy", *deploy);
        } else {
            edit.drop("deploy");
        }
    }

    return edit.changed();
}

bool apply_network(Block& block, const NetworkSpec& want) {
    const NetworkSpec have = decode_network(want.name, block.to_node());
    BlockEditor edit(block);

    if (want.network_name && want.network_name != have.network_name) {
        edit.put("name", YAML::Node(*want.network_name));
    }
    if (want.external && want.external != have.external) {
        edit.put("external", encode_bool(*want.external));
    }

    const bool external = want.external.value_or(have.external.value_or(false));
    if (external) {
        if (want.driver || want.internal || want.enable_ipv6) {
            logger()->debug("network '{}' is external: driver settings ignored", want.name);
        }
        edit.drop("driver");
        edit.drop("internal");
        edit.drop("enable_ipv6");
        return edit.changed();
    }

    if (want.driver && want.driver != have.driver) {
        edit.put("driver", YAML::Node(to_string(*want.driver)));
    }
    if (want.internal && want.internal != have.internal) {
        edit.put("internal", encode_bool(*want.internal));
    }
    if (want.enable_ipv6 && want.enable_ipv6 != have.enable_ipv6) {
        edit.put("enable_ipv6", encode_bool(*want.enable_ipv6));
    }
    return edit.changed();
}

std::string service_header(const ServiceSpec& svc, int indent, int indent_width) {
    if (svc.notes.empty()) return {};
    std::string header = std::string(static_cast<size_t>(indent), ' ') + svc.name + ":\n";
    const std::string pad(static_cast<size_t>(indent + indent_width), ' ');
    for (const auto& note : svc.notes) {
        header += pad + "# " + note + "\n";
    }
    return header;
}

std::string network_header(const NetworkSpec&, int, int) {
    return {};
}

struct SectionReport {
    std::vector<std::string>& added;
    std::vector<std::string>& updated;
    std::vector<std::string>& unchanged;
};

template <typename Spec>
void merge_section(ComposeTree& tree, const std::string& name, Scope scope,
                   const std::vector<Spec>& specs,
                   const std::function<bool(Block&, const Spec&)>& apply,
                   const std::function<std::string(const Spec&, int, int)>& header,
                   SectionReport report) {
    if (specs.empty()) return;

    // An opaque section is only regenerated if something in it changes
    std::optional<Entry> saved;
    if (const Entry* entry = tree.root().find(name)) saved = *entry;

    Block& section = tree.section(name);
    bool touched = false;

    for (const auto& spec : specs) {
        Entry* entry = section.find(spec.name);
        if (!entry) {
            Entry created(spec.name);
            created.block = std::make_unique<Block>(scope, section.indent + tree.indent_width);
            created.header = header(spec, section.indent, tree.indent_width);
            apply(*created.block, spec);
            section.append(std::move(created));
            report.added.push_back(spec.name);
            touched = true;
            logger()->debug("{}: added '{}'", name, spec.name);
            continue;
        }

        Entry candidate = *entry;
        Block& block = section.expand(candidate, scope, tree.indent_width);
        if (apply(block, spec)) {
            *entry = std::move(candidate);
            report.updated.push_back(spec.name);
            touched = true;
            logger()->debug("{}: updated '{}'", name, spec.name);
        } else {
            report.unchanged.push_back(spec.name);
            logger()->debug("{}: '{}' unchanged", name, spec.name);
        }
    }

    if (!touched && saved) {
        *tree.root().find(name) = std::move(*saved);
    }
}

template <typename F>
void for_each_entity(const ComposeTree& tree, const std::string& section, F f) {
    const Entry* entry = tree.root().find(section);
    if (!entry) return;
    const YAML::Node map = entry->to_node();
    if (!map.IsMap()) return;
    for (auto it = map.begin(); it != map.end(); ++it) {
        if (!it->first.IsScalar()) {
            logger()->warn("{}: skipping entry with a non-scalar key", section);
            continue;
        }
        f(it->first.Scalar(), it->second);
    }
}

} // namespace

MergeResult merge(const ComposeTree& tree, const ComposeDocument& doc) {
    check_request(tree, doc);

    MergeResult result{tree, MergeReport{}};
    MergeReport& report = result.report;

    merge_section<NetworkSpec>(result.tree, "networks", Scope::Network, doc.networks(),
                               apply_network, network_header,
                               {report.networks_added, report.networks_updated,
                                report.networks_unchanged});
    merge_section<ServiceSpec>(result.tree, "services", Scope::Service, doc.services(),
                               apply_service, service_header,
                               {report.services_added, report.services_updated,
                                report.services_unchanged});

    logger()->debug("merge: {} service(s) added, {} updated; {} network(s) added, {} updated",
                    report.services_added.size(), report.services_updated.size(),
                    report.networks_added.size(), report.networks_updated.size());
    return result;
}

bool remove_service(ComposeTree& tree, const std::string& name) {
    if (!contains(tree.section_keys("services"), name)) return false;

    std::vector<std::string> issues;
    for_each_entity(tree, "services", [&](const std::string& other, const YAML::Node& node) {
        if (other == name) return;
        const ServiceSpec svc = decode_service(other, node);
        if (svc.depends_on && contains(*svc.depends_on, name)) {
            issues.push_back("service '" + other + "' depends on '" + name + "'");
        }
    });
    if (!issues.empty()) {
        throw ValidationError(std::move(issues));
    }

    bool removed = tree.section("services").erase(name);
    logger()->debug("removed service '{}'", name);
    return removed;
}

bool remove_network(ComposeTree& tree, const std::string& name) {
    if (!contains(tree.section_keys("networks"), name)) return false;

    std::vector<std::string> issues;
    for_each_entity(tree, "services", [&](const std::string& svc_name, const YAML::Node& node) {
        const ServiceSpec svc = decode_service(svc_name, node);
        if (svc.networks && contains(*svc.networks, name)) {
            issues.push_back("service '" + svc_name + "' uses network '" + name + "'");
        }
    });
    if (!issues.empty()) {
        throw ValidationError(std::move(issues));
    }

    bool removed = tree.section("networks").erase(name);
    logger()->debug("removed network '{}'", name);
    return removed;
}

ComposeDocument read_document(const ComposeTree& tree) {
    ComposeDocument doc;
    for_each_entity(tree, "networks", [&](const std::string& name, const YAML::Node& node) {
        try {
            doc.add_network(decode_network(name, node));
        } catch (const ValidationError& e) {
            logger()->warn("skipping network: {}", e.what());
        }
    });
    for_each_entity(tree, "services", [&](const std::string& name, const YAML::Node& node) {
        try {
            doc.add_service(decode_service(name, node));
        } catch (const ValidationError& e) {
            logger()->warn("skipping service: {}", e.what());
        }
    });
    return doc;
}

} // namespace composer
