#ifndef COMPOSER_UTIL_HPP
#define COMPOSER_UTIL_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace composer {

// Merge b into a (recursively). Values in b take precedence.
void deep_merge(nlohmann::json& a, const nlohmann::json& b);

// Helpers
std::string to_lower(std::string s);
std::string trim(const std::string& s);
bool iequals(const std::string& a, const std::string& b);
bool starts_with(const std::string& s, const std::string& prefix);

// Join with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Environment lookup: nullopt when the variable is unset
std::optional<std::string> get_env_var(const std::string& name);

// Replace a leading "~/" with $HOME
std::string expand_user(const std::string& path);

} // namespace composer

#endif // COMPOSER_UTIL_HPP
