// Repeatable values such as `-e KEY=a,b` must reach us unsplit
#define CXXOPTS_VECTOR_DELIMITER '\0'
#include <cxxopts.hpp>

#include <iostream>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "composer/Cli.hpp"
#include "composer/Document.hpp"
#include "composer/Errors.hpp"
#include "composer/Logging.hpp"
#include "composer/Merge.hpp"
#include "composer/Settings.hpp"

using namespace composer;

namespace {

#if defined(CXXOPTS__VERSION_MAJOR) && CXXOPTS__VERSION_MAJOR >= 3
using OptionError = cxxopts::exceptions::exception;
#else
using OptionError = cxxopts::OptionException;
#endif

// Bad invocation, exit code 2
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

const char* kCommands =
    "Commands:\n"
    "  init FILE                         write an empty compose file\n"
    "  build [FILE] -s name:image ...    add or update services and networks\n"
    "  list [FILE] [--json]              show services and networks\n"
    "  remove [FILE] --service NAME | --network NAME ...\n"
    "  presets                           show resource presets\n";

std::vector<std::string> strings(const cxxopts::ParseResult& result, const std::string& key) {
    if (!result.count(key)) return {};
    return result[key].as<std::vector<std::string>>();
}

std::optional<std::string> optional_string(const cxxopts::ParseResult& result, const std::string& key) {
    if (!result.count(key)) return std::nullopt;
    return result[key].as<std::string>();
}

Settings read_settings(const cxxopts::ParseResult& result) {
    SettingsOptions opts;
    if (result.count("config")) {
        opts.file_path = result["config"].as<std::string>();
    } else {
        std::string path = default_settings_path();
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) opts.file_path = path;
    }
    return load_settings(opts);
}

BuildOptions build_options(const cxxopts::ParseResult& result) {
    BuildOptions opts;
    opts.services = strings(result, "service");
    opts.container_name = optional_string(result, "container-name");
    opts.restart = optional_string(result, "restart");
    opts.networks = strings(result, "network");
    opts.new_networks = strings(result, "new-network");
    opts.external_networks = strings(result, "external-network");
    opts.internal_networks = strings(result, "internal-network");
    opts.ports = strings(result, "port");
    opts.environment = strings(result, "env");
    opts.volumes = strings(result, "volume");
    opts.labels = strings(result, "label");
    opts.depends_on = strings(result, "depends-on");
    opts.preset = optional_string(result, "preset");
    opts.cpus = optional_string(result, "cpus");
    opts.memory = optional_string(result, "memory");
    opts.notes = strings(result, "note");

    const bool on = result.count("auto-update") > 0;
    const bool off = result.count("no-auto-update") > 0;
    if (on && off) throw UsageError("--auto-update and --no-auto-update are exclusive");
    if (on) opts.auto_update = true;
    if (off) opts.auto_update = false;
    return opts;
}

int cmd_build(const std::string& file, const cxxopts::ParseResult& result, const Settings& settings) {
    BuildOptions opts = build_options(result);
    if (opts.services.empty() && opts.new_networks.empty() && opts.external_networks.empty() &&
        opts.internal_networks.empty()) {
        throw UsageError("build needs at least one --service or network option");
    }

    ComposeDocument doc = build_document(opts, settings.presets);
    ComposeTree tree = try_load_compose_file(file).value_or(ComposeTree{});
    MergeResult merged = merge(tree, doc);

    std::cout << format_report(merged.report);
    if (merged.report.changed()) {
        write_compose_file(merged.tree, file);
    }
    return 0;
}

int cmd_list(const std::string& file, const cxxopts::ParseResult& result) {
    ComposeDocument doc = read_document(load_compose_file(file));
    if (result.count("json")) {
        std::cout << to_json(doc).dump(2) << "\n";
    } else {
        std::cout << format_listing(doc);
    }
    return 0;
}

int cmd_remove(const std::string& file, const cxxopts::ParseResult& result) {
    const auto services = strings(result, "service");
    const auto networks = strings(result, "network");
    if (services.empty() && networks.empty()) {
        throw UsageError("remove needs --service or --network");
    }

    ComposeTree tree = load_compose_file(file);
    int removed = 0;
    int missing = 0;
    for (const auto& name : services) {
        if (remove_service(tree, name)) {
            std::cout << "Removed service " << name << "\n";
            ++removed;
        } else {
            logger()->warn("service '{}' not found in {}", name, file);
            ++missing;
        }
    }
    for (const auto& name : networks) {
        if (remove_network(tree, name)) {
            std::cout << "Removed network " << name << "\n";
            ++removed;
        } else {
            logger()->warn("network '{}' not found in {}", name, file);
            ++missing;
        }
    }

    if (removed > 0) {
        write_compose_file(tree, file);
    }
    return missing > 0 ? 1 : 0;
}

int run(const cxxopts::Options& options, const cxxopts::ParseResult& result) {
    if (result.count("help") || !result.count("args")) {
        std::cout << options.help() << "\n" << kCommands;
        return result.count("help") ? 0 : 2;
    }

    const auto args = result["args"].as<std::vector<std::string>>();
    const std::string& cmd = args[0];

    Settings settings = read_settings(result);
    std::string level = result.count("log-level") ? result["log-level"].as<std::string>()
                                                  : settings.log_level;
    if (!set_log_level(level)) {
        throw UsageError("unknown log level '" + level + "'");
    }

    if (args.size() > 2) {
        throw UsageError("unexpected argument '" + args[2] + "'");
    }
    const std::string file = args.size() > 1 ? args[1] : settings.infra_file;

    if (cmd == "init") {
        if (args.size() < 2) throw UsageError("init needs a FILE");
        init_compose_file(file);
        std::cout << "Initialized " << file << "\n";
        return 0;
    }
    if (cmd == "build") return cmd_build(file, result, settings);
    if (cmd == "list") return cmd_list(file, result);
    if (cmd == "remove") return cmd_remove(file, result);
    if (cmd == "presets") {
        std::cout << format_presets(settings.presets);
        return 0;
    }
    throw UsageError("unknown command '" + cmd + "'");
}

} // namespace

int main(int argc, char** argv) {
    cxxopts::Options options("compose-manager", "Generate and maintain docker-compose files");
    options.positional_help("COMMAND [FILE]");

    // Global options
    options.add_options()
        ("c,config", "Path to JSON/TOML settings file", cxxopts::value<std::string>())
        ("log-level", "trace, debug, info, warn, error or off", cxxopts::value<std::string>())
        ("h,help", "Show help");

    options.add_options("build")
        ("s,service", "Service as name:image (name only to update)", cxxopts::value<std::vector<std::string>>())
        ("container-name", "Container name (single service)", cxxopts::value<std::string>())
        ("restart", "always, unless-stopped, on-failure or no", cxxopts::value<std::string>())
        ("n,network", "Attach to network (remove: network to delete)", cxxopts::value<std::vector<std::string>>())
        ("new-network", "Declare network name[:driver]", cxxopts::value<std::vector<std::string>>())
        ("external-network", "Declare external network", cxxopts::value<std::vector<std::string>>())
        ("internal-network", "Declare internal network", cxxopts::value<std::vector<std::string>>())
        ("p,port", "Port [ip:]host:container[/proto]", cxxopts::value<std::vector<std::string>>())
        ("e,env", "Environment KEY=VALUE", cxxopts::value<std::vector<std::string>>())
        ("v,volume", "Volume source:target[:mode]", cxxopts::value<std::vector<std::string>>())
        ("l,label", "Label KEY=VALUE", cxxopts::value<std::vector<std::string>>())
        ("depends-on", "Service dependency", cxxopts::value<std::vector<std::string>>())
        ("r,preset", "Resource preset", cxxopts::value<std::string>())
        ("cpus", "CPU limit, overrides the preset", cxxopts::value<std::string>())
        ("memory", "Memory limit, overrides the preset", cxxopts::value<std::string>())
        ("auto-update", "Enable watchtower auto-update")
        ("no-auto-update", "Disable watchtower auto-update")
        ("note", "Comment written under a new service", cxxopts::value<std::vector<std::string>>());

    options.add_options("list")
        ("json", "Print JSON");

    options.add_options()
        ("args", "Command and file", cxxopts::value<std::vector<std::string>>());
    options.parse_positional({"args"});

    try {
        auto result = options.parse(argc, argv);
        return run(options, result);
    } catch (const OptionError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n" << kCommands;
        return 2;
    } catch (const ComposeError& e) {
        logger()->error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        logger()->error("{}", e.what());
        return 1;
    }
}
