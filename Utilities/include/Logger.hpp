#pragma once
#include "spdlog/spdlog.h"

namespace utl {
// To be called in each top level executable
inline void configureLogger() {
  spdlog::set_level(
      static_cast<spdlog::level::level_enum>(SPDLOG_ACTIVE_LEVEL));
  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] [%t] %v");
}

// Runtime override, e.g. from the config file. Messages below
// SPDLOG_ACTIVE_LEVEL are compiled out and stay silent regardless.
inline void setLogLevel(const spdlog::level::level_enum level) {
  spdlog::set_level(level);
}
}  // namespace utl
