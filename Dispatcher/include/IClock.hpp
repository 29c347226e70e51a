#pragma once

#include <chrono>

// Time source for the worker's pause and polling deadlines.
class IClock {
 public:
  using duration = std::chrono::steady_clock::duration;
  using time_point = std::chrono::steady_clock::time_point;

  virtual ~IClock() = default;
  [[nodiscard]] virtual time_point now() const = 0;
};
