/**
 * @file Ordering.cpp
 * @brief Canonical key order tables
 */

#include "composer/Ordering.hpp"
#include "composer/Util.hpp"

#include <algorithm>
#include <numeric>

namespace composer {

namespace {

const std::vector<std::string> kRootKeys = {
    "version", "name", "services", "networks", "volumes", "configs", "secrets"
};

const std::vector<std::string> kServiceKeys = {
    "container_name", "image", "restart", "networks", "ports",
    "environment", "volumes", "depends_on", "labels", "deploy"
};

const std::vector<std::string> kNetworkKeys = {
    "name", "driver", "driver_opts", "external", "internal",
    "attachable", "enable_ipv6", "ipam", "labels"
};

const std::vector<std::string> kNoKeys;

int index_of(const std::vector<std::string>& table, const std::string& key) {
    auto it = std::find(table.begin(), table.end(), key);
    if (it == table.end()) return kUnranked;
    return static_cast<int>(it - table.begin());
}

} // namespace

const std::vector<std::string>& canonical_keys(Scope scope) {
    switch (scope) {
        case Scope::Root: return kRootKeys;
        case Scope::Service: return kServiceKeys;
        case Scope::Network: return kNetworkKeys;
        case Scope::Section: return kNoKeys;
    }
    return kNoKeys;
}

int rank(Scope scope, const std::string& key) {
    if (scope == Scope::Root) {
        // Extension fields hold anchors that later keys alias.
        if (starts_with(key, "x-")) return 0;
        int i = index_of(kRootKeys, key);
        return i == kUnranked ? kUnranked : i + 1;
    }
    return index_of(canonical_keys(scope), key);
}

std::vector<std::size_t> canonical_order(Scope scope, const std::vector<std::string>& keys) {
    std::vector<std::size_t> order(keys.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return rank(scope, keys[a]) < rank(scope, keys[b]);
    });
    return order;
}

} // namespace composer
