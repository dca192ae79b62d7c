/**
 * @file test_presets.cpp
 * @brief Unit tests for resource presets (GoogleTest)
 */

#include <gtest/gtest.h>
#include "composer/Errors.hpp"
#include "composer/Presets.hpp"

using namespace composer;
using nlohmann::json;

TEST(Presets, DefaultTable) {
    PresetTable table = default_presets();
    EXPECT_EQ(table.names(), (std::vector<std::string>{"Small", "Medium", "Big"}));

    auto small = table.resolve("Small");
    EXPECT_EQ(small.cpu_limit->to_string(), "0.2");
    EXPECT_EQ(small.memory_limit->to_string(), "64M");
    EXPECT_FALSE(small.has_reservations());

    auto medium = table.resolve("Medium");
    EXPECT_EQ(medium.cpu_limit->to_string(), "0.5");
    EXPECT_EQ(medium.memory_limit->to_string(), "128M");

    auto big = table.resolve("Big");
    EXPECT_EQ(big.cpu_limit->to_string(), "1");
    EXPECT_EQ(big.memory_limit->to_string(), "512M");
}

TEST(Presets, ResolveIsExactMatch) {
    PresetTable table = default_presets();
    EXPECT_TRUE(table.contains("Small"));
    EXPECT_FALSE(table.contains("small"));
    EXPECT_THROW(table.resolve("small"), UnknownPresetError);
}

TEST(Presets, UnknownPresetListsKnownNames) {
    try {
        default_presets().resolve("Huge");
        FAIL() << "expected UnknownPresetError";
    } catch (const UnknownPresetError& e) {
        EXPECT_EQ(e.preset(), "Huge");
        EXPECT_EQ(e.known().size(), 3u);
        EXPECT_NE(std::string(e.what()).find("Small, Medium, Big"), std::string::npos);
    }
}

TEST(Presets, SetReplacesInPlace) {
    PresetTable table = default_presets();
    ResourceLimits tiny;
    tiny.cpu_limit = CpuQuantity(100);
    table.set("Medium", tiny);
    table.set("Tiny", tiny);

    EXPECT_EQ(table.names(), (std::vector<std::string>{"Small", "Medium", "Big", "Tiny"}));
    EXPECT_EQ(table.resolve("Medium"), tiny);
}

// ============================================================================
// Settings form
// ============================================================================

TEST(PresetsFromJson, ArrayForm) {
    auto limits = preset_from_json("api", json::array({"0.75", "256M"}));
    EXPECT_EQ(*limits.cpu_limit, CpuQuantity(750));
    EXPECT_EQ(limits.memory_limit->to_string(), "256M");
}

TEST(PresetsFromJson, NumbersAccepted) {
    auto limits = preset_from_json("api", json::array({0.5, 1024}));
    EXPECT_EQ(*limits.cpu_limit, CpuQuantity(500));
    EXPECT_EQ(*limits.memory_limit, MemoryQuantity(1024));
}

TEST(PresetsFromJson, ObjectFormWithReservations) {
    json j = {
        {"cpus", "2"},
        {"memory", "1G"},
        {"reservations", {{"cpus", "0.5"}, {"memory", "256M"}}}
    };
    auto limits = preset_from_json("db", j);
    EXPECT_EQ(limits.cpu_limit->to_string(), "2");
    EXPECT_EQ(limits.memory_limit->to_string(), "1G");
    EXPECT_EQ(limits.cpu_reservation->to_string(), "0.5");
    EXPECT_EQ(limits.memory_reservation->to_string(), "256M");
}

TEST(PresetsFromJson, Malformed) {
    EXPECT_THROW(preset_from_json("x", json::array({"1"})), ValidationError);
    EXPECT_THROW(preset_from_json("x", json("1")), ValidationError);
    EXPECT_THROW(preset_from_json("x", json::object()), ValidationError);
    EXPECT_THROW(preset_from_json("x", json{{"cpus", "fast"}}), ValidationError);
    EXPECT_THROW(preset_from_json("x", json{{"cpus", true}}), ValidationError);
    EXPECT_THROW(preset_from_json("x", json{{"cpus", "1"}, {"reservations", "none"}}), ValidationError);
}

TEST(PresetsFromJson, Table) {
    json j = {
        {"Api", json::array({"0.5", "128M"})},
        {"Worker", {{"memory", "2G"}}}
    };
    PresetTable table = presets_from_json(j);
    EXPECT_EQ(table.entries().size(), 2u);
    EXPECT_FALSE(table.contains("Small"));
    EXPECT_FALSE(table.resolve("Worker").cpu_limit.has_value());

    EXPECT_THROW(presets_from_json(json::array()), ValidationError);
}
