#pragma once

#include "design/design_config.hpp"
#include <yaml-cpp/yaml.h>
#include <string>

namespace srm_design {
namespace config {

/**
 * @brief Build a design configuration from a parsed YAML document
 *
 * Missing keys keep their defaults. Unknown keys are reported with a
 * warning. The result is validated.
 * @param root Document root (a map)
 * @return Validated configuration
 * @throws InvalidInput for malformed values or a non-physical configuration
 */
design::DesignConfig parseDesignConfig(const YAML::Node& root);

/**
 * @brief Load and validate a design configuration file
 * @param path Path to a YAML file
 * @throws InvalidInput if the file cannot be read or parsed
 */
design::DesignConfig loadDesignConfig(const std::string& path);

} // namespace config
} // namespace srm_design
