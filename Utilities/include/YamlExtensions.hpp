#pragma once

#include <yaml-cpp/yaml.h>

#include <magic_enum/magic_enum.hpp>
#include <spdlog/common.h>
#include <string>
#include <type_traits>

#include "CommonDefinitions.hpp"

namespace YAML {

// Decodes enums by enumerator name, e.g. 'Linear' or 'CHAR_SIZE_8'.
template <typename T>
struct convert_enum {
  static_assert(std::is_enum_v<T>, "convert_enum<T> requires an enum type");

  static Node encode(const T& rhs) {
    return Node(std::string(magic_enum::enum_name(rhs)));
  }

  static bool decode(const Node& node, T& rhs) {
    if (!node.IsScalar()) return false;
    auto opt = magic_enum::enum_cast<T>(node.as<std::string>());
    if (!opt.has_value()) return false;
    rhs = opt.value();
    return true;
  }
};

template <>
struct convert<utl::EMoveType> : convert_enum<utl::EMoveType> {};

template <>
struct convert<spdlog::level::level_enum>
    : convert_enum<spdlog::level::level_enum> {};

}  // namespace YAML
