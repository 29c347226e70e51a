#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// Splits an inbound byte stream into trimmed, non-empty text lines.
// Accepts '\n' and "\r\n" terminators; a trailing fragment is kept until
// the rest of its line arrives.
class LineAssembler {
 public:
  explicit LineAssembler(std::size_t maxLineLength = 4096);

  [[nodiscard]] std::vector<std::string> feed(std::string_view bytes);
  void reset();
  [[nodiscard]] std::size_t pendingBytes() const { return _partial.size(); }

 private:
  static void sanitize(std::string& line);

  std::string _partial;
  std::size_t _maxLineLength;
};
