/**
 * @file Parse.cpp
 * @brief Implementation of compose field parsing
 */

#include "composer/Parse.hpp"
#include "composer/Errors.hpp"
#include "composer/Util.hpp"

#include <limits>
#include <regex>

namespace composer {

namespace {
    /**
     * @brief Check if string matches regex pattern
     */
    bool matches_regex(const std::string& str, const std::string& pattern) {
        std::regex re(pattern);
        return std::regex_match(str, re);
    }

    /**
     * @brief A port number or range, each number in 1..65535
     */
    bool is_port_spec(const std::string& s) {
        std::smatch m;
        static const std::regex re("^([0-9]{1,5})(?:-([0-9]{1,5}))?$");
        if (!std::regex_match(s, m, re)) return false;
        auto in_range = [](const std::string& n) {
            long v = std::stol(n);
            return v >= 1 && v <= 65535;
        };
        if (!in_range(m[1].str())) return false;
        if (m[2].matched && (!in_range(m[2].str()) || std::stol(m[2].str()) < std::stol(m[1].str()))) {
            return false;
        }
        return true;
    }

    [[noreturn]] void fail(const std::string& what, const std::string& text, const std::string& why) {
        throw ValidationError("invalid " + what + " '" + text + "': " + why);
    }
}

PortMapping parse_port_mapping(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) fail("port", text, "empty");

    PortMapping port;
    auto slash = s.rfind('/');
    if (slash != std::string::npos) {
        port.protocol = to_lower(s.substr(slash + 1));
        s = s.substr(0, slash);
        if (port.protocol != "tcp" && port.protocol != "udp" && port.protocol != "sctp") {
            fail("port", text, "unknown protocol '" + port.protocol + "'");
        }
    }

    auto colon = s.rfind(':');
    if (colon == std::string::npos) {
        port.container = s;
    } else {
        port.host = s.substr(0, colon);
        port.container = s.substr(colon + 1);
        if (port.host.empty()) fail("port", text, "empty host part");

        // "ip:port", "ip:" (ephemeral host port) or "port"
        auto host_colon = port.host.rfind(':');
        std::string host_port = host_colon == std::string::npos
            ? port.host : port.host.substr(host_colon + 1);
        bool has_ip = host_colon != std::string::npos;
        if (!(has_ip && host_port.empty()) && !is_port_spec(host_port)) {
            fail("port", text, "host port must be a number or range");
        }
    }
    if (!is_port_spec(port.container)) {
        fail("port", text, "container port must be a number or range");
    }
    return port;
}

VolumeMapping parse_volume_mapping(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) fail("volume", text, "empty");

    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        auto pos = s.find(':', start);
        parts.push_back(s.substr(start, pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }

    VolumeMapping vol;
    switch (parts.size()) {
        case 1:
            vol.target = parts[0];
            break;
        case 2:
            vol.source = parts[0];
            vol.target = parts[1];
            break;
        case 3:
            vol.source = parts[0];
            vol.target = parts[1];
            vol.mode = parts[2];
            break;
        default:
            fail("volume", text, "expected source:target[:mode]");
    }
    if (vol.target.empty()) fail("volume", text, "empty target");
    if (parts.size() > 1 && vol.source.empty()) fail("volume", text, "empty source");
    if (parts.size() == 3 && vol.mode.empty()) fail("volume", text, "empty mode");
    return vol;
}

std::pair<std::string, std::string> parse_env_assignment(const std::string& text) {
    auto eq = text.find('=');
    std::string key = trim(eq == std::string::npos ? text : text.substr(0, eq));
    std::string value = eq == std::string::npos ? std::string() : text.substr(eq + 1);
    if (key.empty()) fail("environment variable", text, "empty name");
    if (key.find_first_of(" \t") != std::string::npos) {
        fail("environment variable", text, "name contains whitespace");
    }
    return {key, value};
}

std::pair<std::string, std::string> parse_label_assignment(const std::string& text) {
    auto eq = text.find('=');
    std::string key = trim(eq == std::string::npos ? text : text.substr(0, eq));
    std::string value = eq == std::string::npos ? std::string() : text.substr(eq + 1);
    if (key.empty()) fail("label", text, "empty key");
    return {key, value};
}

CpuQuantity parse_cpu_quantity(const std::string& text) {
    std::string s = trim(text);
    // Pattern: ^[0-9]+(\.[0-9]+)?$ or a leading-dot fraction
    if (!matches_regex(s, "^([0-9]+(\\.[0-9]*)?|\\.[0-9]+)$")) {
        fail("cpu count", text, "expected a decimal number of cores");
    }
    double cores = 0;
    try {
        cores = std::stod(s);
    } catch (const std::out_of_range&) {
        fail("cpu count", text, "value too large");
    }
    if (cores >= static_cast<double>(std::numeric_limits<std::int64_t>::max()) / 1000.0) {
        fail("cpu count", text, "value too large");
    }
    CpuQuantity quantity = CpuQuantity::from_cores(cores);
    // A zero limit means unlimited to docker
    if (cores > 0 && quantity.millicores() == 0) {
        fail("cpu count", text, "below the 0.001 core resolution");
    }
    return quantity;
}

MemoryQuantity parse_memory_quantity(const std::string& text) {
    std::string s = trim(text);
    std::smatch m;
    static const std::regex re("^([0-9]+)\\s*([A-Za-z]*)$");
    if (!std::regex_match(s, m, re)) {
        fail("memory size", text, "expected an integer with optional unit");
    }

    std::uint64_t value = 0;
    try {
        value = std::stoull(m[1].str());
    } catch (const std::out_of_range&) {
        fail("memory size", text, "value too large");
    }

    std::string unit = to_lower(m[2].str());
    std::uint64_t multiplier = 0;
    if (unit.empty() || unit == "b") multiplier = 1;
    else if (unit == "k" || unit == "kb") multiplier = 1024ULL;
    else if (unit == "m" || unit == "mb") multiplier = 1024ULL * 1024;
    else if (unit == "g" || unit == "gb") multiplier = 1024ULL * 1024 * 1024;
    else fail("memory size", text, "unknown unit '" + m[2].str() + "'");

    if (value > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        fail("memory size", text, "value too large");
    }
    return MemoryQuantity(value * multiplier);
}

std::pair<std::string, std::string> parse_service_image(const std::string& text) {
    std::string s = trim(text);
    auto colon = s.find(':');
    if (colon == std::string::npos) return {s, ""};
    return {s.substr(0, colon), s.substr(colon + 1)};
}

NetworkSpec parse_network_option(const std::string& text) {
    std::string s = trim(text);
    auto colon = s.find(':');
    NetworkSpec net(colon == std::string::npos ? s : s.substr(0, colon));
    if (net.name.empty()) fail("network", text, "empty name");
    if (colon != std::string::npos) {
        auto driver = parse_network_driver(s.substr(colon + 1));
        if (!driver) fail("network", text, "unknown driver '" + s.substr(colon + 1) + "'");
        net.driver = driver;
    }
    return net;
}

} // namespace composer
