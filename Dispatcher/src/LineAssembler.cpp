#include "LineAssembler.hpp"

#include <Logger.hpp>

#include <algorithm>
#include <cctype>

LineAssembler::LineAssembler(const std::size_t maxLineLength)
    : _maxLineLength(std::max<std::size_t>(1u, maxLineLength)) {}

std::vector<std::string> LineAssembler::feed(std::string_view bytes) {
  std::vector<std::string> lines;
  for (const char c : bytes) {
    if (c == '\n') {
      auto line = std::move(_partial);
      _partial.clear();
      sanitize(line);
      if (!line.empty()) {
        lines.push_back(std::move(line));
      }
      continue;
    }
    _partial.push_back(c);
    if (_partial.size() >= _maxLineLength) {
      SPDLOG_WARN("Inbound line exceeds {} bytes without terminator, "
                  "flushing it as a line",
                  _maxLineLength);
      auto line = std::move(_partial);
      _partial.clear();
      sanitize(line);
      if (!line.empty()) {
        lines.push_back(std::move(line));
      }
    }
  }
  return lines;
}

void LineAssembler::reset() { _partial.clear(); }

void LineAssembler::sanitize(std::string& line) {
  auto isJunk = [](unsigned char c) { return std::isspace(c) || c == '\0'; };
  while (!line.empty() && isJunk(static_cast<unsigned char>(line.back()))) {
    line.pop_back();
  }
  const auto first = std::find_if_not(line.begin(), line.end(), [&](char c) {
    return isJunk(static_cast<unsigned char>(c));
  });
  line.erase(line.begin(), first);
}
