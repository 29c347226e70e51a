#pragma once

#include <string_view>

namespace utl {
enum class EConnectionState {
  Disconnected,
  Connecting,
  Connected,
  Disconnecting,
  Error
};

enum class EResponseType { Position, Endstop, Ok, Busy, Error, Other };

enum class EMoveType { Rapid, Linear };

std::string_view getMoveCode(EMoveType moveType);

}  // namespace utl
