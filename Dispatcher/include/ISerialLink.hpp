#pragma once

#include <string>

// One physical (or simulated) line-oriented serial connection.
//
// Reads and writes happen on the worker thread only. closeNoThrow() and
// isOpen() may be called from any thread; closeNoThrow() must unblock a
// pending read or write so a stuck worker can be force-released.
class ISerialLink {
 public:
  virtual ~ISerialLink() = default;

  // Throws ConnectError (PortUnavailable, InvalidBaud, InvalidParameters).
  virtual void open(const std::string& port, unsigned int baudRate) = 0;
  virtual void closeNoThrow() noexcept = 0;
  [[nodiscard]] virtual bool isOpen() const = 0;

  // Appends the line terminator. Throws IoError.
  virtual void writeLine(const std::string& line) = 0;
  // Bounded-time read of whatever arrived, possibly nothing. Throws IoError.
  [[nodiscard]] virtual std::string readAvailable() = 0;

  // Diagnostic name; may block on I/O, so teardown paths do not call it.
  [[nodiscard]] virtual std::string describe() const = 0;
};
