#include "ResponseClassifier.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace {
std::string toLower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string_view trim(std::string_view value) {
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  return value;
}

bool startsWith(std::string_view value, std::string_view prefix) {
  return value.substr(0, prefix.size()) == prefix;
}

std::optional<double> parseNumber(std::string_view text) {
  double value = 0.0;
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
  }
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

// "x_min: TRIGGERED" / "z_probe: open"
std::optional<std::pair<std::string, bool>> parseMarlinEndstop(
    std::string_view line) {
  const auto colon = line.find(':');
  if (colon == std::string_view::npos || colon == 0) {
    return std::nullopt;
  }
  const auto name = trim(line.substr(0, colon));
  const auto state = toLower(trim(line.substr(colon + 1)));
  const auto underscore = name.find('_');
  if (underscore == std::string_view::npos || underscore == 0) {
    return std::nullopt;
  }
  const auto suffix = toLower(name.substr(underscore + 1));
  if (suffix != "min" && suffix != "max" && suffix != "probe") {
    return std::nullopt;
  }
  if (state == "triggered") {
    return std::make_pair(std::string(name), true);
  }
  if (state == "open") {
    return std::make_pair(std::string(name), false);
  }
  return std::nullopt;
}
}  // namespace

utl::EResponseType ResponseClassifier::classify(std::string_view line) {
  line = trim(line);
  const auto lower = toLower(line);
  if (isAcknowledgement(line)) {
    return utl::EResponseType::Ok;
  }
  if (startsWith(lower, "echo:busy") || startsWith(lower, "busy:")) {
    return utl::EResponseType::Busy;
  }
  if (startsWith(lower, "error") || startsWith(lower, "!!")) {
    return utl::EResponseType::Error;
  }
  if (parseEndstops(line)) {
    return utl::EResponseType::Endstop;
  }
  if (const auto positions = parsePosition(line)) {
    const auto hasX = std::any_of(positions->begin(), positions->end(),
                                  [](const auto& axis) { return axis.first == 'X'; });
    if (hasX) {
      return utl::EResponseType::Position;
    }
  }
  return utl::EResponseType::Other;
}

bool ResponseClassifier::isAcknowledgement(std::string_view line) {
  line = trim(line);
  if (line.size() < 2) {
    return false;
  }
  if (std::tolower(static_cast<unsigned char>(line[0])) != 'o' ||
      std::tolower(static_cast<unsigned char>(line[1])) != 'k') {
    return false;
  }
  return line.size() == 2 ||
         !std::isalnum(static_cast<unsigned char>(line[2]));
}

std::optional<ResponseClassifier::AxisPositions>
ResponseClassifier::parsePosition(std::string_view line) {
  AxisPositions positions;
  std::istringstream iss{std::string(trim(line))};
  std::string token;
  while (iss >> token) {
    if (token == "Count") {
      break;
    }
    if (token.size() < 3 || token[1] != ':' ||
        !std::isalpha(static_cast<unsigned char>(token[0]))) {
      return std::nullopt;
    }
    const auto value = parseNumber(std::string_view(token).substr(2));
    if (!value) {
      return std::nullopt;
    }
    positions.emplace_back(
        static_cast<char>(std::toupper(static_cast<unsigned char>(token[0]))),
        *value);
  }
  if (positions.empty()) {
    return std::nullopt;
  }
  return positions;
}

std::optional<ResponseClassifier::EndstopStates>
ResponseClassifier::parseEndstops(std::string_view line) {
  line = trim(line);
  if (auto single = parseMarlinEndstop(line)) {
    return EndstopStates{{single->first, single->second}};
  }

  if (!startsWith(toLower(line), "endstops")) {
    return std::nullopt;
  }
  const auto dash = line.find('-');
  if (dash == std::string_view::npos) {
    return std::nullopt;
  }

  EndstopStates states;
  auto rest = line.substr(dash + 1);
  while (!rest.empty()) {
    const auto comma = rest.find(',');
    const auto entry = trim(rest.substr(0, comma));
    rest = comma == std::string_view::npos ? std::string_view{}
                                           : rest.substr(comma + 1);
    if (entry.empty()) {
      continue;
    }
    const auto colon = entry.find(':');
    if (colon == std::string_view::npos || colon == 0) {
      return std::nullopt;
    }
    const auto axis = trim(entry.substr(0, colon));
    const auto state = toLower(trim(entry.substr(colon + 1)));
    states[std::string(axis)] = startsWith(state, "at ");
  }
  if (states.empty()) {
    return std::nullopt;
  }
  return states;
}
