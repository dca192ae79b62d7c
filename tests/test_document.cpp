/**
 * @file test_document.cpp
 * @brief Tests for compose file loading, round-tripping and writing (Catch2)
 *
 * Tests cover:
 * - Byte-identical output for untouched documents
 * - Document markers, empty files and malformed input
 * - File loading, init and atomic replacement
 * - Merging through files
 */

#include <catch2/catch_all.hpp>
#include "composer/AtomicFile.hpp"
#include "composer/Document.hpp"
#include "composer/Errors.hpp"
#include "composer/Merge.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

using namespace composer;

// ============================================================================
// Test fixtures and helpers
// ============================================================================

namespace {

/**
 * @brief RAII helper for a scratch directory
 */
class TempDir {
public:
    TempDir() : path_(fs::temp_directory_path() /
                      ("composer_test_dir_" + std::to_string(std::rand()))) {
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    fs::path path() const { return path_; }

    std::string create_file(const std::string& name, const std::string& content) {
        fs::path file_path = path_ / name;
        std::ofstream out(file_path, std::ios::binary);
        out << content;
        return file_path.string();
    }

    std::vector<std::string> names() const {
        std::vector<std::string> result;
        for (const auto& entry : fs::directory_iterator(path_)) {
            result.push_back(entry.path().filename().string());
        }
        return result;
    }

private:
    fs::path path_;
};

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

const char* kCommented =
    "# Home lab\n"
    "# maintained by hand and by compose-manager\n"
    "version: \"3.8\"\n"
    "\n"
    "x-logging: &logging\n"
    "  driver: json-file\n"
    "\n"
    "services:\n"
    "  # reverse proxy\n"
    "  traefik:\n"
    "    image: traefik:v3.0\n"
    "    command:\n"
    "      - --providers.docker=true   # discover containers\n"
    "    ports: [\"80:80\", \"443:443\"]\n"
    "\n"
    "  # monitoring\n"
    "  grafana:\n"
    "    image: grafana/grafana\n"
    "    environment:\n"
    "      GF_SERVER_ROOT_URL: https://grafana.example\n"
    "    healthcheck:\n"
    "      test: >\n"
    "        curl -f\n"
    "        http://localhost:3000\n"
    "\n"
    "networks:\n"
    "  proxy:\n"
    "    external: true\n"
    "\n"
    "# end of file\n";

} // namespace

// ============================================================================
// Round trip
// ============================================================================

TEST_CASE("Untouched documents serialize byte for byte", "[document][roundtrip]") {
    SECTION("comments, blank lines and mixed styles") {
        REQUIRE(serialize(parse_compose(kCommented)) == kCommented);
    }

    SECTION("four-space indentation without final newline") {
        const std::string text =
            "services:\n"
            "    web:\n"
            "        image: nginx\n"
            "        restart: always";
        ComposeTree tree = parse_compose(text);
        REQUIRE(serialize(tree) == text);
        REQUIRE(tree.indent_width == 4);
    }

    SECTION("flow-style section kept as one entry") {
        const std::string text = "services: {web: {image: nginx}}\n";
        ComposeTree tree = parse_compose(text);
        REQUIRE(serialize(tree) == text);
        REQUIRE(tree.find_section("services") == nullptr);
        REQUIRE(tree.section_keys("services") == std::vector<std::string>{"web"});
    }

    SECTION("reparsing output is stable") {
        const std::string once = serialize(parse_compose(kCommented));
        REQUIRE(serialize(parse_compose(once)) == once);
    }
}

TEST_CASE("Nested mappings split down to service level", "[document][split]") {
    const std::string text =
        "services:\n"
        "  web:\n"
        "    image: nginx\n"
        "    environment:\n"
        "      TZ: UTC\n"
        "      LANG: C\n"
        "    deploy:\n"
        "      resources:\n"
        "        limits:\n"
        "          cpus: \"0.5\"\n"
        "networks:\n"
        "  proxy:\n"
        "    external: true\n";
    ComposeTree tree = parse_compose(text);

    const Block* services = tree.find_section("services");
    REQUIRE(services != nullptr);
    const Entry* web = services->find("web");
    REQUIRE(web != nullptr);
    REQUIRE(web->is_block());
    REQUIRE(web->block->keys() == std::vector<std::string>{"image", "environment", "deploy"});

    const Entry* env = web->block->find("environment");
    REQUIRE(env != nullptr);
    REQUIRE_FALSE(env->is_block());
    REQUIRE(env->value.IsMap());
    REQUIRE(env->value["LANG"].Scalar() == "C");

    const Entry* deploy = web->block->find("deploy");
    REQUIRE(deploy->value["resources"]["limits"]["cpus"].Scalar() == "0.5");

    REQUIRE(tree.section_keys("networks") == std::vector<std::string>{"proxy"});
    REQUIRE(serialize(tree) == text);
}

TEST_CASE("Document markers", "[document][markers]") {
    SECTION("leading --- is kept") {
        const std::string text = "---\nservices:\n  web:\n    image: nginx\n";
        REQUIRE(serialize(parse_compose(text)) == text);
    }

    SECTION("closing ... is kept") {
        const std::string text = "services:\n  web:\n    image: nginx\n...\n";
        ComposeTree tree = parse_compose(text);
        REQUIRE(serialize(tree) == text);
        REQUIRE(tree.section_keys("services") == std::vector<std::string>{"web"});
    }

    SECTION("a second document is rejected") {
        REQUIRE_THROWS_AS(parse_compose("---\nservices: {}\n---\nnetworks: {}\n"), ParseError);
        REQUIRE_THROWS_AS(parse_compose("services: {}\n...\nnetworks: {}\n"), ParseError);
    }
}

TEST_CASE("Empty input gives an empty tree", "[document]") {
    ComposeTree blank = parse_compose("");
    REQUIRE(blank.empty());
    REQUIRE(serialize(blank).empty());

    const std::string comments = "# nothing here yet\n\n";
    ComposeTree commented = parse_compose(comments);
    REQUIRE(commented.empty());
    REQUIRE(serialize(commented) == comments);
}

TEST_CASE("Malformed input", "[document][errors]") {
    SECTION("syntax error carries the origin and a position") {
        try {
            parse_compose("services:\n  web:\n    image: \"nginx\n", "infra.yml");
            FAIL("expected ParseError");
        } catch (const ParseError& e) {
            REQUIRE(e.file() == "infra.yml");
            REQUIRE(e.line() >= 2);
            REQUIRE_THAT(e.what(), Catch::Matchers::ContainsSubstring("infra.yml"));
        }
    }

    SECTION("root must be a mapping") {
        try {
            parse_compose("- web\n- db\n");
            FAIL("expected ParseError");
        } catch (const ParseError& e) {
            REQUIRE_THAT(e.details(), Catch::Matchers::ContainsSubstring("must be a mapping"));
        }
    }

    SECTION("services must be a mapping") {
        try {
            parse_compose("services:\n  - web\n");
            FAIL("expected ParseError");
        } catch (const ParseError& e) {
            REQUIRE(e.details() == "'services' must be a mapping");
            REQUIRE(e.line() == 2);
        }
    }
}

// ============================================================================
// Files
// ============================================================================

TEST_CASE("Loading compose files", "[document][files]") {
    TempDir dir;

    SECTION("missing file") {
        const std::string path = (dir.path() / "absent.yml").string();
        REQUIRE_THROWS_AS(load_compose_file(path), FileNotFoundError);
        REQUIRE_FALSE(try_load_compose_file(path).has_value());
    }

    SECTION("directory") {
        REQUIRE_THROWS_AS(load_compose_file(dir.path().string()), IOError);
    }

    SECTION("existing file keeps its origin") {
        const std::string path = dir.create_file("infra.yml", kCommented);
        auto tree = try_load_compose_file(path);
        REQUIRE(tree.has_value());
        REQUIRE(tree->origin == path);
        REQUIRE(tree->section_keys("services") == std::vector<std::string>{"traefik", "grafana"});
    }
}

TEST_CASE("Initializing a compose file", "[document][files]") {
    TempDir dir;
    const std::string path = (dir.path() / "stacks" / "home" / "infra.yml").string();

    init_compose_file(path);
    REQUIRE(read_file(path) == "services: {}\nnetworks: {}\n");

    ComposeTree tree = load_compose_file(path);
    REQUIRE(tree.section_keys("services").empty());

    REQUIRE_THROWS_AS(init_compose_file(path), IOError);
    REQUIRE(read_file(path) == "services: {}\nnetworks: {}\n");
}

TEST_CASE("Atomic replacement", "[document][files][atomic]") {
    TempDir dir;

    SECTION("failed rename leaves no temporary file") {
        fs::create_directories(dir.path() / "taken");
        const std::string target = (dir.path() / "taken").string();
        REQUIRE_THROWS_AS(write_compose_file(parse_compose("services: {}\n"), target), IOError);
        REQUIRE(fs::is_directory(target));
        REQUIRE(dir.names() == std::vector<std::string>{"taken"});
    }

    SECTION("abandoned write keeps the old content") {
        const std::string target = dir.create_file("infra.yml", "services: {}\n");
        std::string temp;
        {
            AtomicFile file(target);
            temp = file.temp_path();
            file.write("networks: {}\n");
            REQUIRE(fs::exists(temp));
        }
        REQUIRE_FALSE(fs::exists(temp));
        REQUIRE(read_file(target) == "services: {}\n");
    }

    SECTION("commit replaces the target") {
        const std::string target = dir.create_file("infra.yml", "old\n");
        atomic_write_file(target, "services: {}\n");
        REQUIRE(read_file(target) == "services: {}\n");
        REQUIRE(dir.names() == std::vector<std::string>{"infra.yml"});
    }
}

// ============================================================================
// Merging through files
// ============================================================================

TEST_CASE("Auto-update survives a write and reload", "[document][merge]") {
    TempDir dir;
    const std::string path = (dir.path() / "infra.yml").string();
    init_compose_file(path);

    ServiceSpec web("web");
    web.image = "nginx";
    web.auto_update = true;
    ComposeDocument doc;
    doc.add_service(web);

    write_compose_file(merge(load_compose_file(path), doc).tree, path);

    ComposeDocument read = read_document(load_compose_file(path));
    const ServiceSpec* svc = read.find_service("web");
    REQUIRE(svc != nullptr);
    REQUIRE(svc->auto_update == std::optional<bool>(true));
    REQUIRE(svc->labels->empty());

    // Same request again: nothing to write
    REQUIRE_FALSE(merge(load_compose_file(path), doc).report.changed());
}

TEST_CASE("Rejected merge leaves the file alone", "[document][merge]") {
    TempDir dir;
    const std::string path = dir.create_file("infra.yml", kCommented);

    ServiceSpec web("web");
    web.image = "nginx";
    web.networks = std::vector<std::string>{"backend"};
    ComposeDocument doc;
    doc.add_service(web);

    ComposeTree tree = load_compose_file(path);
    REQUIRE_THROWS_AS(merge(tree, doc), ValidationError);
    REQUIRE(serialize(tree) == kCommented);
    REQUIRE(read_file(path) == kCommented);
}

TEST_CASE("Adding to an opaque section regenerates it", "[document][merge]") {
    ComposeTree tree = parse_compose("services: {web: {image: nginx}}\n");

    ServiceSpec db("db");
    db.image = "postgres";
    ComposeDocument doc;
    doc.add_service(db);

    const std::string out = serialize(merge(tree, doc).tree);
    REQUIRE_THAT(out, Catch::Matchers::ContainsSubstring("  db:\n    image: postgres\n"));

    ComposeDocument read = read_document(parse_compose(out));
    REQUIRE(read.find_service("web") != nullptr);
    REQUIRE(*read.find_service("db")->image == "postgres");
}
