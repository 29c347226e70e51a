#pragma once

#include <memory>

#include <yaml-cpp/yaml.h>

#include "ISerialLink.hpp"

std::unique_ptr<ISerialLink> makeSerialLink(const YAML::Node& linkConfig);
