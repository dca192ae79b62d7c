/**
 * @file Spec.hpp
 * @brief Value objects describing services, networks and a compose document
 *
 * Pure data, no I/O. Optional fields use std::optional as a presence
 * wrapper: an empty optional means "not supplied" and leaves the matching
 * key of an existing block untouched during a merge.
 */

#ifndef COMPOSER_SPEC_HPP
#define COMPOSER_SPEC_HPP

#include "composer/Resources.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace composer {

/// Label that gates watchtower auto-updates; managed through ServiceSpec::auto_update.
inline constexpr const char* kAutoUpdateLabel = "com.centurylinklabs.watchtower.enable";

/// Network every compose project has without declaring it.
inline constexpr const char* kDefaultNetwork = "default";

// ============================================================================
// Enumerations
// ============================================================================

enum class RestartPolicy {
    Always,
    UnlessStopped,
    OnFailure,
    No
};

std::string to_string(RestartPolicy policy);

/**
 * @brief Parse a compose restart policy ("always", "unless-stopped", "on-failure", "no")
 * @return nullopt for anything else
 */
std::optional<RestartPolicy> parse_restart_policy(const std::string& text);

enum class NetworkDriver {
    Bridge,
    Overlay,
    Host,
    None,
    Macvlan
};

std::string to_string(NetworkDriver driver);
std::optional<NetworkDriver> parse_network_driver(const std::string& text);

// ============================================================================
// Collection elements
// ============================================================================

/**
 * @brief Published port, `[ip:]host:container[/proto]`
 *
 * `host` may be empty (container port only) and may carry a bind address.
 * `protocol` is empty when none was written.
 */
struct PortMapping {
    std::string host;
    std::string container;
    std::string protocol;

    std::string to_string() const;

    /// Protocol with the compose default applied
    std::string effective_protocol() const { return protocol.empty() ? "tcp" : protocol; }

    bool operator==(const PortMapping& o) const {
        return host == o.host && container == o.container &&
               effective_protocol() == o.effective_protocol();
    }
    bool operator!=(const PortMapping& o) const { return !(*this == o); }
};

/**
 * @brief Volume binding, `source:target[:mode]`
 *
 * `source` is empty for anonymous volumes.
 */
struct VolumeMapping {
    std::string source;
    std::string target;
    std::string mode;

    std::string to_string() const;

    bool operator==(const VolumeMapping& o) const {
        return source == o.source && target == o.target && mode == o.mode;
    }
    bool operator!=(const VolumeMapping& o) const { return !(*this == o); }
};

/// Ordered name → value mapping (environment, labels)
using KeyValueList = std::vector<std::pair<std::string, std::string>>;

// ============================================================================
// ServiceSpec / NetworkSpec
// ============================================================================

struct ServiceSpec {
    std::string name;

    std::optional<std::string> container_name;
    std::optional<std::string> image;
    std::optional<RestartPolicy> restart;
    std::optional<std::vector<std::string>> networks;
    std::optional<std::vector<PortMapping>> ports;
    std::optional<KeyValueList> environment;
    std::optional<std::vector<VolumeMapping>> volumes;
    std::optional<std::vector<std::string>> depends_on;
    std::optional<KeyValueList> labels;      ///< never contains kAutoUpdateLabel
    std::optional<ResourceLimits> resources;
    std::optional<bool> auto_update;

    /// Comment lines written under the service key when the block is created
    std::vector<std::string> notes;

    ServiceSpec() = default;
    explicit ServiceSpec(std::string n) : name(std::move(n)) {}
};

struct NetworkSpec {
    std::string name;

    std::optional<std::string> network_name; ///< compose `name:` key
    std::optional<NetworkDriver> driver;
    std::optional<bool> external;
    std::optional<bool> internal;
    std::optional<bool> enable_ipv6;

    NetworkSpec() = default;
    explicit NetworkSpec(std::string n) : name(std::move(n)) {}
};

// ============================================================================
// ComposeDocument
// ============================================================================

/**
 * @brief Ordered set of services and networks targeted by one merge
 */
class ComposeDocument {
public:
    /**
     * @brief Append a service
     * @throws ValidationError if a service of the same name (case-insensitive) exists
     */
    ServiceSpec& add_service(ServiceSpec service);

    /**
     * @brief Append a network
     * @throws ValidationError if a network of the same name (case-insensitive) exists
     */
    NetworkSpec& add_network(NetworkSpec network);

    const ServiceSpec* find_service(const std::string& name) const;
    const NetworkSpec* find_network(const std::string& name) const;

    const std::vector<ServiceSpec>& services() const noexcept { return services_; }
    const std::vector<NetworkSpec>& networks() const noexcept { return networks_; }

    bool empty() const noexcept { return services_.empty() && networks_.empty(); }

private:
    std::vector<ServiceSpec> services_;
    std::vector<NetworkSpec> networks_;
};

/**
 * @brief Shape checks on every spec of a document
 *
 * Collects all issues: malformed names, duplicate ports, duplicate
 * environment/label keys, duplicate network or depends_on entries, the
 * managed label inside `labels`, an empty supplied image. Referential
 * integrity is checked by the merge engine, which also knows the networks
 * of the existing file.
 *
 * @return Issues found, empty when the document is well formed
 */
std::vector<std::string> collect_issues(const ComposeDocument& doc);

/**
 * @brief collect_issues() that throws
 * @throws ValidationError listing every issue
 */
void validate(const ComposeDocument& doc);

/**
 * @brief True for names compose accepts as service/network keys: [A-Za-z0-9._-]+
 */
bool is_valid_name(const std::string& name);

} // namespace composer

#endif // COMPOSER_SPEC_HPP
