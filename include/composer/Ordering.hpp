/**
 * @file Ordering.hpp
 * @brief Canonical key order for compose blocks
 *
 * rank(scope, key) is a pure function. Recognized keys get their position
 * in the scope's canonical list; anything else ranks kUnranked and, since
 * canonical_order() sorts stably, keeps the order it was encountered in.
 */

#ifndef COMPOSER_ORDERING_HPP
#define COMPOSER_ORDERING_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace composer {

/**
 * @brief Kind of block a key lives in
 */
enum class Scope {
    Root,     ///< top level of the document
    Section,  ///< `services:` / `networks:` maps, keyed by entity name
    Service,  ///< one service block
    Network   ///< one network block
};

/// Rank of every key a scope does not recognize
inline constexpr int kUnranked = 1000;

/**
 * @brief Sort rank of a key within a scope
 *
 * Root: `x-*` extension keys first, then version, name, services, networks,
 * volumes, configs, secrets.
 * Service: container_name, image, restart, networks, ports, environment,
 * volumes, depends_on, labels, deploy.
 * Network: name, driver, driver_opts, external, internal, attachable,
 * enable_ipv6, ipam, labels.
 * Section: nothing is recognized.
 */
int rank(Scope scope, const std::string& key);

/**
 * @brief Canonical permutation of a key sequence
 *
 * @return Indices into `keys`, sorted by rank; equal ranks keep input order.
 */
std::vector<std::size_t> canonical_order(Scope scope, const std::vector<std::string>& keys);

/**
 * @brief The recognized keys of a scope, in canonical order
 */
const std::vector<std::string>& canonical_keys(Scope scope);

} // namespace composer

#endif // COMPOSER_ORDERING_HPP
