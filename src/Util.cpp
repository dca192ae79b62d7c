#include "composer/Util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace composer {

void deep_merge(nlohmann::json& a, const nlohmann::json& b) {
    if (!a.is_object() || !b.is_object()) {
        a = b;
        return;
    }
    for (auto it = b.begin(); it != b.end(); ++it) {
        const auto& key = it.key();
        const auto& bv  = it.value();
        if (a.contains(key) && a[key].is_object() && bv.is_object()) {
            deep_merge(a[key], bv);
        } else {
            a[key] = bv;
        }
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && to_lower(a) == to_lower(b);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

std::optional<std::string> get_env_var(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string expand_user(const std::string& path) {
    if (path == "~" || starts_with(path, "~/")) {
        auto home = get_env_var("HOME");
        if (home) return *home + path.substr(1);
    }
    return path;
}

} // namespace composer
