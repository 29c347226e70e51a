#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <CommonDefinitions.hpp>

// Recognises the firmware replies a robot-arm host cares about.
class ResponseClassifier {
 public:
  // Axis letter -> position, in the order the firmware reported them.
  using AxisPositions = std::vector<std::pair<char, double>>;
  // "X" or "x_min" style endstop name -> triggered.
  using EndstopStates = std::map<std::string, bool>;

  [[nodiscard]] static utl::EResponseType classify(std::string_view line);

  // "ok" as a whole word at the start of the line, any case.
  [[nodiscard]] static bool isAcknowledgement(std::string_view line);

  // "X:10.500 Y:20.000 Z:-5.250 E:0.00 Count X:..." (M114).
  [[nodiscard]] static std::optional<AxisPositions> parsePosition(
      std::string_view line);

  // "Endstops - X: at min stop, Y: not stopped" or "x_min: TRIGGERED" (M119).
  [[nodiscard]] static std::optional<EndstopStates> parseEndstops(
      std::string_view line);
};
