/**
 * @file test_settings.cpp
 * @brief Tests for settings loading (Catch2)
 *
 * Tests cover:
 * - JSON and TOML settings files
 * - Precedence: defaults -> file -> environment -> overrides
 * - Preset tables from settings
 * - Malformed and missing files
 */

#include <catch2/catch_all.hpp>
#include "composer/Errors.hpp"
#include "composer/Settings.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace composer;

namespace {

/**
 * @brief RAII helper for a settings file in the temp directory
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension)
        : path_(fs::temp_directory_path() /
                ("composer_settings_" + std::to_string(std::rand()) + extension)) {
        std::ofstream out(path_);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

/**
 * @brief RAII helper for environment variables
 */
class ScopedEnvVar {
public:
    ScopedEnvVar(const std::string& name, const std::string& value) : name_(name) {
        ::setenv(name.c_str(), value.c_str(), 1);
    }

    ~ScopedEnvVar() {
        ::unsetenv(name_.c_str());
    }

private:
    std::string name_;
};

SettingsOptions options_without_env() {
    SettingsOptions opts;
    opts.env_prefix.clear();
    return opts;
}

} // namespace

TEST_CASE("Defaults", "[settings]") {
    Settings settings = load_settings(options_without_env());
    REQUIRE(settings.infra_file == "infra.yml");
    REQUIRE(settings.log_level == "info");
    REQUIRE(settings.presets.names() == std::vector<std::string>{"Small", "Medium", "Big"});
}

TEST_CASE("JSON settings file", "[settings][json]") {
    TempFile file(R"({"infra_file": "/srv/stack/compose.yml", "log_level": "debug"})", ".json");

    SettingsOptions opts = options_without_env();
    opts.file_path = file.path();
    Settings settings = load_settings(opts);

    REQUIRE(settings.infra_file == "/srv/stack/compose.yml");
    REQUIRE(settings.log_level == "debug");
    REQUIRE(settings.presets.contains("Medium"));
}

TEST_CASE("TOML settings file with presets", "[settings][toml]") {
    TempFile file(
        "infra_file = \"stack.yml\"\n"
        "\n"
        "[presets]\n"
        "Api = [\"0.5\", \"128M\"]\n"
        "\n"
        "[presets.Db]\n"
        "cpus = 2\n"
        "memory = \"1G\"\n"
        "\n"
        "[presets.Db.reservations]\n"
        "memory = \"512M\"\n",
        ".toml");

    SettingsOptions opts = options_without_env();
    opts.file_path = file.path();
    Settings settings = load_settings(opts);

    REQUIRE(settings.infra_file == "stack.yml");
    REQUIRE(settings.log_level == "info");

    // A preset table replaces the built-in one
    REQUIRE_FALSE(settings.presets.contains("Small"));
    ResourceLimits db = settings.presets.resolve("Db");
    REQUIRE(db.cpu_limit->to_string() == "2");
    REQUIRE(db.memory_limit->to_string() == "1G");
    REQUIRE(db.memory_reservation->to_string() == "512M");
    REQUIRE(settings.presets.resolve("Api").cpu_limit->to_string() == "0.5");
}

TEST_CASE("Precedence", "[settings]") {
    TempFile file(R"({"infra_file": "from-file.yml", "log_level": "warn"})", ".json");
    ScopedEnvVar env("COMPOSER_TEST_INFRA_FILE", "from-env.yml");

    SettingsOptions opts;
    opts.env_prefix = "COMPOSER_TEST";
    opts.file_path = file.path();

    SECTION("environment beats the file") {
        Settings settings = load_settings(opts);
        REQUIRE(settings.infra_file == "from-env.yml");
        REQUIRE(settings.log_level == "warn");
    }

    SECTION("overrides beat the environment") {
        opts.overrides = {{"infra_file", "from-override.yml"}};
        REQUIRE(load_settings(opts).infra_file == "from-override.yml");
    }

    SECTION("empty prefix disables the environment") {
        opts.env_prefix.clear();
        REQUIRE(load_settings(opts).infra_file == "from-file.yml");
    }
}

TEST_CASE("Malformed settings", "[settings][errors]") {
    SettingsOptions opts = options_without_env();

    SECTION("missing file") {
        opts.file_path = (fs::temp_directory_path() / "composer_settings_absent.toml").string();
        REQUIRE_THROWS_AS(load_settings(opts), FileNotFoundError);
    }

    SECTION("unsupported extension") {
        TempFile file("infra_file: x.yml\n", ".yaml");
        opts.file_path = file.path();
        REQUIRE_THROWS_AS(load_settings(opts), ParseError);
    }

    SECTION("invalid JSON") {
        TempFile file("{\"infra_file\": ", ".json");
        opts.file_path = file.path();
        REQUIRE_THROWS_AS(load_settings(opts), ParseError);
    }

    SECTION("invalid TOML reports a line") {
        TempFile file("log_level = \"info\"\ninfra_file = \n", ".toml");
        opts.file_path = file.path();
        try {
            load_settings(opts);
            FAIL("expected ParseError");
        } catch (const ParseError& e) {
            REQUIRE(e.line() == 2);
            REQUIRE(e.file() == file.path());
        }
    }

    SECTION("root is not an object") {
        TempFile file("[1, 2]", ".json");
        opts.file_path = file.path();
        REQUIRE_THROWS_AS(load_settings(opts), ParseError);
    }

    SECTION("wrong value type") {
        opts.overrides = {{"log_level", 3}};
        REQUIRE_THROWS_AS(load_settings(opts), ValidationError);
    }

    SECTION("bad preset") {
        opts.overrides = {{"presets", {{"Tiny", {{"cpus", "fast"}}}}}};
        REQUIRE_THROWS_AS(load_settings(opts), ValidationError);
    }
}

TEST_CASE("Default settings path", "[settings]") {
    const std::string path = default_settings_path();
    REQUIRE_THAT(path, Catch::Matchers::EndsWith(".compose_manager.toml"));
    REQUIRE(path.front() != '~');
}
