/**
 * @file Parse.hpp
 * @brief Text-to-model parsing for compose field values
 *
 * Converts the short textual forms used on a command line and in compose
 * short syntax into the typed values of the service and network model:
 * - Ports: `[ip:]host:container[/proto]` or `container[/proto]`
 * - Volumes: `source:target[:mode]` or `target`
 * - Environment / labels: `KEY=VALUE` (a bare `KEY` has an empty value)
 * - CPU: decimal core count ("0.5", "2")
 * - Memory: integer with optional unit b, k, kb, m, mb, g, gb (binary multiples)
 *
 * Malformed input throws ValidationError naming the offending text.
 */

#ifndef COMPOSER_PARSE_HPP
#define COMPOSER_PARSE_HPP

#include "composer/Resources.hpp"
#include "composer/Spec.hpp"

#include <string>
#include <utility>

namespace composer {

/**
 * @brief Parse a port mapping
 *
 * Examples:
 * ```cpp
 * parse_port_mapping("80:80")                // host "80", container "80"
 * parse_port_mapping("127.0.0.1:8080:80")    // host "127.0.0.1:8080"
 * parse_port_mapping("53:53/udp")            // protocol "udp"
 * parse_port_mapping("9000")                 // container only
 * ```
 * @throws ValidationError for empty parts, non-numeric ports or an unknown protocol
 */
PortMapping parse_port_mapping(const std::string& text);

/**
 * @brief Parse a volume binding
 *
 * Examples:
 * ```cpp
 * parse_volume_mapping("./config:/config")           // source, target
 * parse_volume_mapping("/var/run/docker.sock:/var/run/docker.sock:ro")
 * parse_volume_mapping("/data")                      // anonymous volume
 * ```
 * @throws ValidationError for an empty target or more than three parts
 */
VolumeMapping parse_volume_mapping(const std::string& text);

/**
 * @brief Parse `KEY=VALUE`; only the first '=' splits
 * @throws ValidationError when KEY is empty
 */
std::pair<std::string, std::string> parse_env_assignment(const std::string& text);

/**
 * @brief Parse a label `key=value`
 * @throws ValidationError when the key is empty
 */
std::pair<std::string, std::string> parse_label_assignment(const std::string& text);

/**
 * @brief Parse a CPU core count
 * @throws ValidationError for non-numeric or negative values
 */
CpuQuantity parse_cpu_quantity(const std::string& text);

/**
 * @brief Parse a memory size with unit suffix
 * @throws ValidationError for unknown units or non-numeric values
 */
MemoryQuantity parse_memory_quantity(const std::string& text);

/**
 * @brief Split the CLI `name:image` form
 *
 * The first ':' separates the service name from the image, so tags survive:
 * "web:nginx:1.25" gives {"web", "nginx:1.25"}. A bare name yields an empty image.
 */
std::pair<std::string, std::string> parse_service_image(const std::string& text);

/**
 * @brief Parse the CLI `name[:driver]` network form
 * @throws ValidationError for an unknown driver
 */
NetworkSpec parse_network_option(const std::string& text);

} // namespace composer

#endif // COMPOSER_PARSE_HPP
