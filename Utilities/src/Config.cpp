#include "Config.hpp"

namespace utl {

void Config::setConfigPath(const std::string& configPath) {
  try {
    _topNode = YAML::LoadFile(configPath);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(fmt::format(
        "Failed to load config file '{}': {}", configPath, e.what()));
  }
  _configPath = configPath;
  SPDLOG_DEBUG("Loaded config file '{}'", _configPath);
}

YAML::Node Config::getClassConfig(std::string_view className) const {
  if (!_topNode || !_topNode["classes"]) {
    throw std::runtime_error(fmt::format(
        "Config file '{}' is missing 'classes' section", _configPath));
  }

  YAML::Node classNode = _topNode["classes"][std::string(className)];
  if (!classNode || !classNode.IsDefined()) {
    throw std::runtime_error(fmt::format(
        "Failed to find entry for '{}' in the config file '{}'",
        className, _configPath));
  }

  return classNode;
}

YAML::Node Config::getOptionalSection(std::string_view className,
                                      std::string_view key) const {
  const YAML::Node classNode = getClassConfig(className);
  const YAML::Node section = classNode[std::string(key)];
  if (!section || !section.IsDefined() || section.IsNull()) {
    return YAML::Node(YAML::NodeType::Map);
  }
  if (!section.IsMap()) {
    throw std::runtime_error(fmt::format(
        "Config entry '{}.{}' in '{}' must be a map", className, key,
        _configPath));
  }
  return section;
}

}  // namespace utl
