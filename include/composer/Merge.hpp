/**
 * @file Merge.hpp
 * @brief Merge engine: reconcile a ComposeDocument with an existing tree
 *
 * Merging rules:
 * - Service/network absent from the tree: a new block is inserted, keys in
 *   canonical order
 * - Present: every supplied field replaces the matching key; keys the request
 *   does not supply are left alone (field-level merge)
 * - Collections (ports, volumes, environment, labels, networks, depends_on)
 *   are replaced as a whole; a supplied empty collection removes the key
 * - A block is rewritten only when some field changed value, compared
 *   semantically (`1024M` equals `1G`, list and map environment are equal
 *   when they hold the same pairs)
 * - Nothing is removed because it is missing from the request; removal goes
 *   through remove_service() / remove_network()
 *
 * The whole request is validated before the first edit, and the edits are
 * made on a copy, so a rejected merge leaves the caller's tree unchanged.
 *
 * Example:
 * ```cpp
 * ComposeTree tree = try_load_compose_file("infra.yml").value_or(ComposeTree{});
 * ComposeDocument doc;
 * ServiceSpec web("web");
 * web.image = "nginx:latest";
 * web.ports = std::vector<PortMapping>{parse_port_mapping("80:80")};
 * doc.add_service(web);
 * MergeResult result = merge(tree, doc);
 * write_compose_file(result.tree, "infra.yml");
 * ```
 */

#ifndef COMPOSER_MERGE_HPP
#define COMPOSER_MERGE_HPP

#include "composer/Document.hpp"
#include "composer/Spec.hpp"

#include <string>
#include <vector>

namespace composer {

/**
 * @brief What a merge did, by entity name
 */
struct MergeReport {
    std::vector<std::string> services_added;
    std::vector<std::string> services_updated;
    std::vector<std::string> services_unchanged;
    std::vector<std::string> networks_added;
    std::vector<std::string> networks_updated;
    std::vector<std::string> networks_unchanged;

    /// True if the merged tree differs from the input tree
    bool changed() const noexcept {
        return !services_added.empty() || !services_updated.empty() ||
               !networks_added.empty() || !networks_updated.empty();
    }
};

struct MergeResult {
    ComposeTree tree;
    MergeReport report;
};

/**
 * @brief Merge every service and network of `doc` into a copy of `tree`
 *
 * Checks before any edit:
 * - collect_issues(doc)
 * - names colliding case-insensitively with a differently spelled existing entry
 * - new services without an image
 * - service networks that are neither in `doc`, in the tree, nor `default`
 * - depends_on targets that are neither in `doc` nor in the tree
 *
 * @throws ValidationError listing every issue found; `tree` is not modified
 */
MergeResult merge(const ComposeTree& tree, const ComposeDocument& doc);

/**
 * @brief Delete a service block
 * @return false if the service does not exist
 * @throws ValidationError if a remaining service lists it in depends_on
 */
bool remove_service(ComposeTree& tree, const std::string& name);

/**
 * @brief Delete a network block
 * @return false if the network does not exist
 * @throws ValidationError if a remaining service is attached to it
 */
bool remove_network(ComposeTree& tree, const std::string& name);

/**
 * @brief Services and networks currently in the tree, for display
 *
 * Entries that cannot be interpreted are skipped with a warning.
 */
ComposeDocument read_document(const ComposeTree& tree);

} // namespace composer

#endif // COMPOSER_MERGE_HPP
