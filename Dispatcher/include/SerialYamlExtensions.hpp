#pragma once

#include <libserial/SerialPortConstants.h>

#include <YamlExtensions.hpp>

// LibSerial line settings, spelled as in the LibSerial headers
// (e.g. 'CHAR_SIZE_8', 'PARITY_NONE'). Baud rates are plain integers and are
// validated by SerialPortLink::toBaudRate instead.
namespace YAML {

template <>
struct convert<LibSerial::CharacterSize>
    : convert_enum<LibSerial::CharacterSize> {};

template <>
struct convert<LibSerial::FlowControl> : convert_enum<LibSerial::FlowControl> {
};

template <>
struct convert<LibSerial::Parity> : convert_enum<LibSerial::Parity> {};

template <>
struct convert<LibSerial::StopBits> : convert_enum<LibSerial::StopBits> {};

}  // namespace YAML
