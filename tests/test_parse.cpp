/**
 * @file test_parse.cpp
 * @brief Unit tests for compose field parsing (GoogleTest)
 *
 * Covers the short textual forms accepted on the command line:
 * ports, volumes, KEY=VALUE pairs, CPU and memory quantities,
 * `name:image` and `name[:driver]`.
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "composer/Errors.hpp"
#include "composer/Parse.hpp"

using namespace composer;

// ============================================================================
// Ports
// ============================================================================

TEST(ParsePort, HostAndContainer) {
    auto p = parse_port_mapping("8080:80");
    EXPECT_EQ(p.host, "8080");
    EXPECT_EQ(p.container, "80");
    EXPECT_EQ(p.protocol, "");
}

TEST(ParsePort, WithAddress) {
    auto p = parse_port_mapping("127.0.0.1:8080:80");
    EXPECT_EQ(p.host, "127.0.0.1:8080");
    EXPECT_EQ(p.container, "80");
}

TEST(ParsePort, EphemeralHostPortOnAddress) {
    auto p = parse_port_mapping("127.0.0.1::80");
    EXPECT_EQ(p.host, "127.0.0.1:");
    EXPECT_EQ(p.container, "80");
}

TEST(ParsePort, Protocol) {
    auto p = parse_port_mapping("53:53/UDP");
    EXPECT_EQ(p.protocol, "udp");
    EXPECT_EQ(p.to_string(), "53:53/udp");
}

TEST(ParsePort, ContainerOnlyAndRanges) {
    EXPECT_EQ(parse_port_mapping("9000").container, "9000");
    EXPECT_TRUE(parse_port_mapping("9000").host.empty());

    auto r = parse_port_mapping("8000-8010:8000-8010");
    EXPECT_EQ(r.host, "8000-8010");
    EXPECT_EQ(r.container, "8000-8010");
}

TEST(ParsePort, Invalid) {
    EXPECT_THROW(parse_port_mapping(""), ValidationError);
    EXPECT_THROW(parse_port_mapping("http:80"), ValidationError);
    EXPECT_THROW(parse_port_mapping("80:abc"), ValidationError);
    EXPECT_THROW(parse_port_mapping("70000:80"), ValidationError);
    EXPECT_THROW(parse_port_mapping("0"), ValidationError);
    EXPECT_THROW(parse_port_mapping("80:80/http"), ValidationError);
    EXPECT_THROW(parse_port_mapping(":80"), ValidationError);
    EXPECT_THROW(parse_port_mapping("9000-8000:80"), ValidationError);
}

TEST(ParsePort, ErrorNamesTheInput) {
    try {
        parse_port_mapping("80:abc");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("invalid port '80:abc'"), std::string::npos);
    }
}

// ============================================================================
// Volumes
// ============================================================================

TEST(ParseVolume, SourceAndTarget) {
    auto v = parse_volume_mapping("./config:/config");
    EXPECT_EQ(v.source, "./config");
    EXPECT_EQ(v.target, "/config");
    EXPECT_EQ(v.mode, "");
}

TEST(ParseVolume, Mode) {
    auto v = parse_volume_mapping("/var/run/docker.sock:/var/run/docker.sock:ro");
    EXPECT_EQ(v.source, "/var/run/docker.sock");
    EXPECT_EQ(v.mode, "ro");
}

TEST(ParseVolume, AnonymousVolume) {
    auto v = parse_volume_mapping("/data");
    EXPECT_TRUE(v.source.empty());
    EXPECT_EQ(v.target, "/data");
}

TEST(ParseVolume, Invalid) {
    EXPECT_THROW(parse_volume_mapping(""), ValidationError);
    EXPECT_THROW(parse_volume_mapping("a:b:c:d"), ValidationError);
    EXPECT_THROW(parse_volume_mapping(":/data"), ValidationError);
    EXPECT_THROW(parse_volume_mapping("./data:"), ValidationError);
    EXPECT_THROW(parse_volume_mapping("./data:/data:"), ValidationError);
}

// ============================================================================
// KEY=VALUE
// ============================================================================

TEST(ParseAssignment, Environment) {
    EXPECT_EQ(parse_env_assignment("TZ=Europe/Berlin"),
              (std::pair<std::string, std::string>{"TZ", "Europe/Berlin"}));
    // Only the first '=' splits
    EXPECT_EQ(parse_env_assignment("OPTS=a=b").second, "a=b");
    EXPECT_EQ(parse_env_assignment("EMPTY").second, "");
    EXPECT_EQ(parse_env_assignment("LIST=a,b").second, "a,b");
}

TEST(ParseAssignment, EnvironmentInvalid) {
    EXPECT_THROW(parse_env_assignment("=value"), ValidationError);
    EXPECT_THROW(parse_env_assignment("MY VAR=1"), ValidationError);
}

TEST(ParseAssignment, Label) {
    auto l = parse_label_assignment("traefik.http.routers.web.rule=Host(`a.example`)");
    EXPECT_EQ(l.first, "traefik.http.routers.web.rule");
    EXPECT_EQ(l.second, "Host(`a.example`)");
    EXPECT_THROW(parse_label_assignment("=x"), ValidationError);
}

// ============================================================================
// Quantities
// ============================================================================

TEST(ParseQuantity, Cpu) {
    EXPECT_EQ(parse_cpu_quantity("0.5"), CpuQuantity(500));
    EXPECT_EQ(parse_cpu_quantity("2"), CpuQuantity(2000));
    EXPECT_EQ(parse_cpu_quantity(".25"), CpuQuantity(250));
    EXPECT_THROW(parse_cpu_quantity("-1"), ValidationError);
    EXPECT_THROW(parse_cpu_quantity("two"), ValidationError);
    EXPECT_THROW(parse_cpu_quantity(""), ValidationError);
}

TEST(ParseQuantity, CpuResolution) {
    EXPECT_EQ(parse_cpu_quantity("0"), CpuQuantity(0));
    EXPECT_EQ(parse_cpu_quantity("0.001"), CpuQuantity(1));
    // Would round to zero, which docker reads as no limit
    EXPECT_THROW(parse_cpu_quantity("0.0004"), ValidationError);
    EXPECT_THROW(parse_cpu_quantity("99999999999999999999"), ValidationError);
}

TEST(ParseQuantity, Memory) {
    EXPECT_EQ(parse_memory_quantity("128M"), MemoryQuantity(128ULL * 1024 * 1024));
    EXPECT_EQ(parse_memory_quantity("128mb"), MemoryQuantity(128ULL * 1024 * 1024));
    EXPECT_EQ(parse_memory_quantity("1g"), MemoryQuantity(1024ULL * 1024 * 1024));
    EXPECT_EQ(parse_memory_quantity("512k"), MemoryQuantity(512ULL * 1024));
    EXPECT_EQ(parse_memory_quantity("4096"), MemoryQuantity(4096));
    EXPECT_EQ(parse_memory_quantity("64M").to_string(), "64M");
}

TEST(ParseQuantity, MemoryInvalid) {
    EXPECT_THROW(parse_memory_quantity("1.5g"), ValidationError);
    EXPECT_THROW(parse_memory_quantity("12tb"), ValidationError);
    EXPECT_THROW(parse_memory_quantity("lots"), ValidationError);
    EXPECT_THROW(parse_memory_quantity("99999999999999999999999"), ValidationError);
}

TEST(ParseQuantity, MemoryOverflow) {
    // 2^34 G is 2^64 bytes
    EXPECT_THROW(parse_memory_quantity("17179869184G"), ValidationError);
    EXPECT_THROW(parse_memory_quantity("18014398509481984k"), ValidationError);
    EXPECT_EQ(parse_memory_quantity("17179869183G"),
              MemoryQuantity(17179869183ULL * 1024 * 1024 * 1024));
}

// ============================================================================
// CLI forms
// ============================================================================

TEST(ParseServiceImage, KeepsTag) {
    auto [name, image] = parse_service_image("web:nginx:1.25");
    EXPECT_EQ(name, "web");
    EXPECT_EQ(image, "nginx:1.25");
}

TEST(ParseServiceImage, BareName) {
    auto [name, image] = parse_service_image("web");
    EXPECT_EQ(name, "web");
    EXPECT_TRUE(image.empty());
}

TEST(ParseNetworkOption, Driver) {
    auto net = parse_network_option("proxy:overlay");
    EXPECT_EQ(net.name, "proxy");
    ASSERT_TRUE(net.driver.has_value());
    EXPECT_EQ(*net.driver, NetworkDriver::Overlay);

    auto plain = parse_network_option("backend");
    EXPECT_EQ(plain.name, "backend");
    EXPECT_FALSE(plain.driver.has_value());
}

TEST(ParseNetworkOption, Invalid) {
    EXPECT_THROW(parse_network_option("proxy:wormhole"), ValidationError);
    EXPECT_THROW(parse_network_option(":bridge"), ValidationError);
}
