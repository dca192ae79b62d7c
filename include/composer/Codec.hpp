/**
 * @file Codec.hpp
 * @brief Conversion between compose YAML values and the service and network model
 *
 * Decoders read what is already in a file and accept every syntax compose
 * accepts (short and long port/volume forms, list and map environment,
 * labels, networks). Values they cannot interpret are skipped with a
 * warning. Encoders produce the YAML for one service key, keeping the style
 * (list or map form) of the value they replace.
 */

#ifndef COMPOSER_CODEC_HPP
#define COMPOSER_CODEC_HPP

#include "composer/Spec.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <vector>

namespace composer {

// ============================================================================
// Decoding
// ============================================================================

/**
 * @brief Read a service mapping; `kAutoUpdateLabel` is reported as auto_update
 */
ServiceSpec decode_service(const std::string& name, const YAML::Node& node);

NetworkSpec decode_network(const std::string& name, const YAML::Node& node);

/**
 * @brief `KEY=VALUE` list or mapping, in document order, managed label included
 */
KeyValueList decode_key_values(const YAML::Node& node, const std::string& where);

/**
 * @brief Names of a list, or keys of a mapping (service networks, depends_on)
 */
std::vector<std::string> decode_name_list(const YAML::Node& node, const std::string& where);

/**
 * @brief YAML 1.1 boolean words (true/yes/on, false/no/off), case-insensitive
 */
std::optional<bool> decode_bool(const YAML::Node& node);

// ============================================================================
// Encoding
// ============================================================================

/**
 * @brief Names as a list, or as a mapping when `existing` is one
 *
 * In mapping form the per-name settings of names already present are kept
 * and new names get an empty mapping.
 */
YAML::Node encode_name_list(const std::vector<std::string>& names, const YAML::Node& existing);

/**
 * @brief `KEY=VALUE` list when `existing` is a sequence, mapping otherwise
 */
YAML::Node encode_key_values(const KeyValueList& values, const YAML::Node& existing);

YAML::Node encode_ports(const std::vector<PortMapping>& ports);
YAML::Node encode_volumes(const std::vector<VolumeMapping>& volumes);

/**
 * @brief `deploy` with resources.limits / resources.reservations replaced
 *
 * Other keys of `existing` are kept. An emptied `resources` or `deploy` is
 * dropped.
 *
 * @return std::nullopt when nothing is left and `deploy` should be removed
 */
std::optional<YAML::Node> encode_deploy(const ResourceLimits& resources, const YAML::Node& existing);

/**
 * @brief Unquoted `true` / `false`
 */
YAML::Node encode_bool(bool value);

// ============================================================================
// Comparison
// ============================================================================

/**
 * @brief Same keys with the same values, order ignored
 */
bool same_mapping(const KeyValueList& a, const KeyValueList& b);

} // namespace composer

#endif // COMPOSER_CODEC_HPP
