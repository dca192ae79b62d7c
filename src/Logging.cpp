#include "composer/Logging.hpp"
#include "composer/Util.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace composer {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("composer");
        if (existing) return existing;
        auto created = spdlog::stderr_color_mt("composer");
        created->set_pattern("[%^%l%$] %v");
        created->set_level(spdlog::level::info);
        return created;
    }();
    return instance;
}

bool set_log_level(const std::string& level) {
    std::string name = to_lower(level);
    if (name == "warning") name = "warn";
    auto parsed = spdlog::level::from_str(name);
    // from_str falls back to "off" for unknown names
    if (parsed == spdlog::level::off && name != "off") {
        return false;
    }
    logger()->set_level(parsed);
    return true;
}

} // namespace composer
