#pragma once

#include "IClock.hpp"

class SteadyClockAdapter final : public IClock {
 public:
  [[nodiscard]] time_point now() const override {
    return std::chrono::steady_clock::now();
  }
};
