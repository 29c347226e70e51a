#include "SerialLinkFactory.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <stdexcept>

#include "SerialPortLink.hpp"

namespace {
std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}
}  // namespace

std::unique_ptr<ISerialLink> makeSerialLink(const YAML::Node& linkConfig) {
  if (!linkConfig || !linkConfig.IsMap()) {
    throw std::runtime_error("Serial link config must be a map.");
  }
  const auto typeNode = linkConfig["type"];
  if (!typeNode || !typeNode.IsScalar()) {
    throw std::runtime_error("Serial link config must define scalar 'type'.");
  }
  const auto type = typeNode.as<std::string>();
  const auto normalized = toLower(type);
  if (normalized == "serial" || normalized == "tty") {
    return std::make_unique<SerialPortLink>(linkConfig);
  }
  throw std::runtime_error(
      fmt::format("Unsupported serial link type '{}'", type));
}
