#pragma once

#include <libserial/SerialPort.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "ISerialLink.hpp"

class SerialPortLink final : public ISerialLink {
 public:
  // linkConfig is the 'link' map; its optional 'serial' map carries the
  // line settings. Port and baud rate are supplied to open().
  explicit SerialPortLink(const YAML::Node& linkConfig);
  ~SerialPortLink() override;

  void open(const std::string& port, unsigned int baudRate) override;
  void closeNoThrow() noexcept override;
  [[nodiscard]] bool isOpen() const override;
  void writeLine(const std::string& line) override;
  [[nodiscard]] std::string readAvailable() override;
  [[nodiscard]] std::string describe() const override;

  [[nodiscard]] static std::optional<LibSerial::BaudRate> toBaudRate(
      unsigned int baudRate);
  [[nodiscard]] static std::vector<std::string> listPorts();
  [[nodiscard]] static std::optional<std::string> recommendedPort();

 private:
  static char parseLineTerminator(const std::string& token);
  void closeLocked() noexcept;
  void checkHealthLocked();

  // Held across a whole write, including the drain.
  mutable std::timed_mutex _ioMutex;
  std::unique_ptr<LibSerial::SerialPort> _serial;
  std::atomic<bool> _open{false};
  // Written under both mutexes; describe() only takes this one.
  mutable std::mutex _portMutex;
  std::string _port;
  LibSerial::CharacterSize _characterSize;
  LibSerial::FlowControl _flowControl;
  LibSerial::Parity _parity;
  LibSerial::StopBits _stopBits;
  std::size_t _readTimeoutMS;
  char _lineTerminator;
};
