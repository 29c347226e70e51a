#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <CommonDefinitions.hpp>

class GcodeCommandBuilder {
 public:
  using AxisValues = std::vector<std::pair<char, double>>;

  // Servo PWM (0-255) at fully closed (0 %) and fully open (100 %).
  struct GripperRange {
    double closedPwm{0.0};
    double openPwm{255.0};
  };

  // "G1 X10 Y20.5 F1000". Rapid (G0) moves never carry a feed rate.
  [[nodiscard]] static std::string buildAxisCommand(
      utl::EMoveType moveType, const AxisValues& axes,
      std::optional<double> feedRate = std::nullopt);
  [[nodiscard]] static std::string buildSingleAxisCommand(
      utl::EMoveType moveType, char axis, double value,
      std::optional<double> feedRate = std::nullopt);

  // "G28", or "G28 X Y" for a subset of axes.
  [[nodiscard]] static std::string home(std::string_view axes = {});
  [[nodiscard]] static std::string queryPosition() { return "M114"; }
  [[nodiscard]] static std::string queryEndstops() { return "M119"; }
  [[nodiscard]] static std::string emergencyStop() { return "M112"; }
  [[nodiscard]] static std::string enableSteppers() { return "M17"; }
  [[nodiscard]] static std::string disableSteppers() { return "M18"; }
  [[nodiscard]] static std::string resetAlarm() { return "M999"; }
  [[nodiscard]] static std::string quickStop() { return "M410"; }
  // "G0 X0 Y0 Z0 U0 V0 W0"
  [[nodiscard]] static std::string zeroPosition();

  // "M280 P0 S<angle>": percent is mapped linearly onto the PWM range, then
  // onto a 0-180 degree servo angle.
  [[nodiscard]] static std::string gripper(double percent);
  [[nodiscard]] static std::string gripper(double percent,
                                           const GripperRange& range);
  [[nodiscard]] static int gripperServoAngle(double percent,
                                             const GripperRange& range);

 private:
  static char normalizeAxis(char axis);
};
