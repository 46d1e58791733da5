#pragma once
#include <string>
#include "core/config.hpp"

namespace fwp {

// Loads YAML at 'path', applies defaults, validates, throws on error
AppConfig LoadConfigFromYamlFile(const std::string& path);

// Same as above from YAML text
AppConfig LoadConfigFromYamlString(const std::string& yaml);

// Throws error if config is invalid
void ValidateOrThrow(const AppConfig& cfg);

// "motion" | "neural_net" | "replay_log". Throws std::invalid_argument otherwise
DetectorKind ParseDetectorKind(const std::string& name);

}
