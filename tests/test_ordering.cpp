/**
 * @file test_ordering.cpp
 * @brief Unit tests for canonical key ordering (GoogleTest)
 */

#include <gtest/gtest.h>

#include "composer/Ordering.hpp"

using namespace composer;

namespace {

std::vector<std::string> reorder(Scope scope, const std::vector<std::string>& keys) {
    std::vector<std::string> out;
    for (std::size_t i : canonical_order(scope, keys)) {
        out.push_back(keys[i]);
    }
    return out;
}

} // namespace

TEST(Ordering, ServiceKeys) {
    std::vector<std::string> keys = {"labels", "ports", "image", "container_name", "deploy", "restart"};
    std::vector<std::string> expected = {"container_name", "image", "restart", "ports", "labels", "deploy"};
    EXPECT_EQ(reorder(Scope::Service, keys), expected);
}

TEST(Ordering, UnknownKeysGoLastInInputOrder) {
    std::vector<std::string> keys = {"x-custom", "healthcheck", "image", "command"};
    std::vector<std::string> expected = {"image", "x-custom", "healthcheck", "command"};
    EXPECT_EQ(reorder(Scope::Service, keys), expected);
    EXPECT_EQ(rank(Scope::Service, "healthcheck"), kUnranked);
}

TEST(Ordering, RootExtensionsFirst) {
    std::vector<std::string> keys = {"networks", "services", "x-logging", "version", "volumes"};
    std::vector<std::string> expected = {"x-logging", "version", "services", "networks", "volumes"};
    EXPECT_EQ(reorder(Scope::Root, keys), expected);
    EXPECT_EQ(rank(Scope::Root, "x-anything"), 0);
    EXPECT_LT(rank(Scope::Root, "secrets"), kUnranked);
}

TEST(Ordering, NetworkKeys) {
    std::vector<std::string> keys = {"enable_ipv6", "external", "driver", "name"};
    std::vector<std::string> expected = {"name", "driver", "external", "enable_ipv6"};
    EXPECT_EQ(reorder(Scope::Network, keys), expected);
}

TEST(Ordering, SectionKeepsEntityOrder) {
    std::vector<std::string> keys = {"web", "db", "cache"};
    EXPECT_EQ(reorder(Scope::Section, keys), keys);
    EXPECT_TRUE(canonical_keys(Scope::Section).empty());
}

TEST(Ordering, AlreadyCanonicalIsIdentity) {
    const auto& keys = canonical_keys(Scope::Service);
    auto order = canonical_order(Scope::Service, keys);
    for (std::size_t i = 0; i < order.size(); ++i) {
        EXPECT_EQ(order[i], i);
    }
}
