#include "GcodeCommandBuilder.hpp"

#include <cctype>
#include <cmath>
#include <fmt/format.h>
#include <stdexcept>

std::string GcodeCommandBuilder::buildAxisCommand(
    const utl::EMoveType moveType, const AxisValues& axes,
    const std::optional<double> feedRate) {
  if (axes.empty()) {
    throw std::invalid_argument("Movement command needs at least one axis.");
  }
  std::string command(utl::getMoveCode(moveType));
  for (const auto& [axis, value] : axes) {
    if (!std::isfinite(value)) {
      throw std::invalid_argument(
          fmt::format("Non-finite target for axis '{}'", axis));
    }
    command += fmt::format(" {}{}", normalizeAxis(axis), value);
  }
  if (feedRate && moveType == utl::EMoveType::Linear) {
    if (!std::isfinite(*feedRate) || *feedRate <= 0.0) {
      throw std::invalid_argument(
          fmt::format("Feed rate must be positive, got {}", *feedRate));
    }
    command += fmt::format(" F{}", *feedRate);
  }
  return command;
}

std::string GcodeCommandBuilder::buildSingleAxisCommand(
    const utl::EMoveType moveType, const char axis, const double value,
    const std::optional<double> feedRate) {
  return buildAxisCommand(moveType, {{axis, value}}, feedRate);
}

std::string GcodeCommandBuilder::home(std::string_view axes) {
  std::string command{"G28"};
  for (const char axis : axes) {
    if (std::isspace(static_cast<unsigned char>(axis))) {
      continue;
    }
    command += ' ';
    command += normalizeAxis(axis);
  }
  return command;
}

std::string GcodeCommandBuilder::zeroPosition() {
  return buildAxisCommand(utl::EMoveType::Rapid, {{'X', 0.0},
                                                  {'Y', 0.0},
                                                  {'Z', 0.0},
                                                  {'U', 0.0},
                                                  {'V', 0.0},
                                                  {'W', 0.0}});
}

std::string GcodeCommandBuilder::gripper(const double percent) {
  return gripper(percent, GripperRange{});
}

std::string GcodeCommandBuilder::gripper(const double percent,
                                         const GripperRange& range) {
  return fmt::format("M280 P0 S{}", gripperServoAngle(percent, range));
}

int GcodeCommandBuilder::gripperServoAngle(const double percent,
                                           const GripperRange& range) {
  if (!std::isfinite(percent) || percent < 0.0 || percent > 100.0) {
    throw std::invalid_argument(
        fmt::format("Gripper position must be within 0-100 %, got {}", percent));
  }
  for (const double pwm : {range.closedPwm, range.openPwm}) {
    if (!std::isfinite(pwm) || pwm < 0.0 || pwm > 255.0) {
      throw std::invalid_argument(
          fmt::format("Gripper PWM must be within 0-255, got {}", pwm));
    }
  }
  const double pwm =
      range.closedPwm + (percent / 100.0) * (range.openPwm - range.closedPwm);
  return static_cast<int>(pwm / 255.0 * 180.0);
}

char GcodeCommandBuilder::normalizeAxis(const char axis) {
  if (!std::isalpha(static_cast<unsigned char>(axis))) {
    throw std::invalid_argument(
        fmt::format("Axis must be a letter, got '{}'", axis));
  }
  return static_cast<char>(std::toupper(static_cast<unsigned char>(axis)));
}
