#include "SerialPortLink.hpp"

#include <Logger.hpp>
#include <SerialErrors.hpp>
#include <SerialYamlExtensions.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <filesystem>
#include <fmt/format.h>
#include <stdexcept>
#include <termios.h>
#include <unistd.h>

using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {
constexpr auto kCloseLockWait = 500ms;

bool hasPrefix(const std::string& value, const std::string& prefix) {
  return value.rfind(prefix, 0) == 0;
}

template <typename T>
T decodeOptional(const YAML::Node& serialNode, const std::string& key,
                 T fallback) {
  if (!serialNode || !serialNode.IsMap()) {
    return fallback;
  }
  const auto node = serialNode[key];
  if (!node) {
    return fallback;
  }
  try {
    return node.as<T>();
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(
        fmt::format("Invalid value for link.serial.{}: {}", key, e.what()));
  }
}
}  // namespace

SerialPortLink::SerialPortLink(const YAML::Node& linkConfig) {
  const auto serialNode = linkConfig["serial"];
  if (serialNode && serialNode.IsDefined() && !serialNode.IsNull() &&
      !serialNode.IsMap()) {
    throw std::runtime_error("Serial link entry 'link.serial' must be a map.");
  }

  _serial = std::make_unique<LibSerial::SerialPort>();
  _characterSize = decodeOptional(serialNode, "characterSize",
                                  LibSerial::CharacterSize::CHAR_SIZE_8);
  _flowControl = decodeOptional(serialNode, "flowControl",
                                LibSerial::FlowControl::FLOW_CONTROL_NONE);
  _parity =
      decodeOptional(serialNode, "parity", LibSerial::Parity::PARITY_NONE);
  _stopBits = decodeOptional(serialNode, "stopBits",
                             LibSerial::StopBits::STOP_BITS_1);
  _readTimeoutMS = std::max<std::size_t>(
      1u, decodeOptional<std::size_t>(serialNode, "readTimeoutMS", 20u));
  _lineTerminator = parseLineTerminator(
      decodeOptional<std::string>(serialNode, "lineTerminator", "\\n"));
}

SerialPortLink::~SerialPortLink() { closeNoThrow(); }

void SerialPortLink::open(const std::string& port,
                          const unsigned int baudRate) {
  if (port.empty()) {
    throw ConnectError(EConnectErrorReason::InvalidParameters,
                       "Serial port name must not be empty.");
  }
  const auto libSerialBaud = toBaudRate(baudRate);
  if (!libSerialBaud) {
    throw ConnectError(EConnectErrorReason::InvalidBaud,
                       fmt::format("Unsupported baud rate {}", baudRate));
  }

  std::lock_guard<std::timed_mutex> lock(_ioMutex);
  closeLocked();
  {
    std::lock_guard<std::mutex> portLock(_portMutex);
    _port = port;
  }
  try {
    _serial->Open(port);
  } catch (const std::exception& e) {
    closeLocked();
    throw ConnectError(
        EConnectErrorReason::PortUnavailable,
        fmt::format("Cannot open serial port '{}': {}", port, e.what()));
  }

  try {
    _serial->SetBaudRate(*libSerialBaud);
    _serial->SetCharacterSize(_characterSize);
    _serial->SetFlowControl(_flowControl);
    _serial->SetParity(_parity);
    _serial->SetStopBits(_stopBits);
    _serial->FlushIOBuffers();
  } catch (const std::exception& e) {
    closeLocked();
    throw ConnectError(EConnectErrorReason::InvalidParameters,
                       fmt::format("Cannot configure serial port '{}': {}",
                                   port, e.what()));
  }
  _open.store(true, std::memory_order_release);
  SPDLOG_DEBUG("Serial port '{}' opened at {} baud", port, baudRate);
}

void SerialPortLink::closeNoThrow() noexcept {
  std::unique_lock<std::timed_mutex> lock(_ioMutex, std::defer_lock);
  if (!lock.try_lock_for(kCloseLockWait)) {
    // A write is stuck draining; discard pending output so tcdrain returns.
    int fd = -1;
    try {
      fd = _serial->GetFileDescriptor();
    } catch (const std::exception&) {
      fd = -1;
    }
    if (fd >= 0 && ::tcflush(fd, TCIOFLUSH) == -1) {
      SPDLOG_WARN("Serial tcflush(fd={}) failed, errno={}", fd, errno);
    }
    lock.lock();
  }
  closeLocked();
}

void SerialPortLink::closeLocked() noexcept {
  _open.store(false, std::memory_order_release);
  int fd = -1;
  bool closeViaLibSerialFailed = false;
  try {
    fd = _serial->GetFileDescriptor();
  } catch (const std::exception&) {
    fd = -1;
  }

  try {
    if (_serial->IsOpen()) {
      _serial->Close();
    }
  } catch (const std::exception& e) {
    SPDLOG_WARN("Serial close of '{}' via LibSerial failed: {}", _port,
                e.what());
    closeViaLibSerialFailed = true;
  }

  if (closeViaLibSerialFailed && fd >= 0 && ::fcntl(fd, F_GETFD) != -1) {
    if (::close(fd) == -1 && errno != EBADF) {
      SPDLOG_WARN("Serial forced close(fd={}) failed, errno={}", fd, errno);
    }
  }

  if (closeViaLibSerialFailed) {
    SPDLOG_WARN("Keeping poisoned SerialPort instance leaked to avoid "
                "terminate on destructor after close failure.");
    (void)_serial.release();
  }
  _serial = std::make_unique<LibSerial::SerialPort>();
}

bool SerialPortLink::isOpen() const {
  return _open.load(std::memory_order_acquire);
}

void SerialPortLink::writeLine(const std::string& line) {
  std::lock_guard<std::timed_mutex> lock(_ioMutex);
  if (!_open.load(std::memory_order_acquire)) {
    throw IoError(fmt::format("Serial port '{}' is not open", _port));
  }
  try {
    _serial->Write(line + _lineTerminator);
    _serial->DrainWriteBuffer();
  } catch (const std::exception& e) {
    throw IoError(fmt::format("Serial write to '{}' failed: {}", _port,
                              e.what()));
  }
}

std::string SerialPortLink::readAvailable() {
  std::lock_guard<std::timed_mutex> lock(_ioMutex);
  if (!_open.load(std::memory_order_acquire)) {
    throw IoError(fmt::format("Serial port '{}' is not open", _port));
  }

  std::string data;
  try {
    char first = 0;
    _serial->ReadByte(first, _readTimeoutMS);
    data.push_back(first);
    const auto pending = _serial->GetNumberOfBytesAvailable();
    if (pending > 0) {
      std::string rest;
      _serial->Read(rest, static_cast<std::size_t>(pending), _readTimeoutMS);
      data += rest;
    }
    return data;
  } catch (const LibSerial::ReadTimeout&) {
    checkHealthLocked();
    return data;
  } catch (const std::exception& e) {
    throw IoError(fmt::format("Serial read from '{}' failed: {}", _port,
                              e.what()));
  }
}

void SerialPortLink::checkHealthLocked() {
  // An unplugged USB adapter reads as a timeout; FIONREAD fails instead.
  try {
    if (!_serial->IsOpen()) {
      throw std::runtime_error("port is no longer open");
    }
    (void)_serial->GetNumberOfBytesAvailable();
  } catch (const std::exception& e) {
    throw IoError(fmt::format("Serial health check of '{}' failed: {}",
                              _port, e.what()));
  }
}

std::string SerialPortLink::describe() const {
  std::lock_guard<std::mutex> lock(_portMutex);
  return fmt::format("serial({})", _port.empty() ? "unassigned" : _port);
}

std::optional<LibSerial::BaudRate> SerialPortLink::toBaudRate(
    const unsigned int baudRate) {
  using LibSerial::BaudRate;
  switch (baudRate) {
    case 50: return BaudRate::BAUD_50;
    case 75: return BaudRate::BAUD_75;
    case 110: return BaudRate::BAUD_110;
    case 134: return BaudRate::BAUD_134;
    case 150: return BaudRate::BAUD_150;
    case 200: return BaudRate::BAUD_200;
    case 300: return BaudRate::BAUD_300;
    case 600: return BaudRate::BAUD_600;
    case 1200: return BaudRate::BAUD_1200;
    case 1800: return BaudRate::BAUD_1800;
    case 2400: return BaudRate::BAUD_2400;
    case 4800: return BaudRate::BAUD_4800;
    case 9600: return BaudRate::BAUD_9600;
    case 19200: return BaudRate::BAUD_19200;
    case 38400: return BaudRate::BAUD_38400;
    case 57600: return BaudRate::BAUD_57600;
    case 115200: return BaudRate::BAUD_115200;
    case 230400: return BaudRate::BAUD_230400;
    case 460800: return BaudRate::BAUD_460800;
    case 500000: return BaudRate::BAUD_500000;
    case 576000: return BaudRate::BAUD_576000;
    case 921600: return BaudRate::BAUD_921600;
    case 1000000: return BaudRate::BAUD_1000000;
    case 1152000: return BaudRate::BAUD_1152000;
    case 1500000: return BaudRate::BAUD_1500000;
    default: return std::nullopt;
  }
}

std::vector<std::string> SerialPortLink::listPorts() {
  std::vector<std::string> ports;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator("/dev", ec)) {
    const auto name = entry.path().filename().string();
    if (hasPrefix(name, "ttyACM") || hasPrefix(name, "ttyUSB")) {
      ports.push_back(entry.path().string());
    }
  }
  const fs::path byId{"/dev/serial/by-id"};
  if (fs::is_directory(byId, ec)) {
    for (const auto& entry : fs::directory_iterator(byId, ec)) {
      ports.push_back(entry.path().string());
    }
  }
  std::sort(ports.begin(), ports.end());
  return ports;
}

std::optional<std::string> SerialPortLink::recommendedPort() {
  const auto ports = listPorts();
  for (const char* prefix : {"/dev/ttyACM", "/dev/ttyUSB"}) {
    const auto it = std::find_if(ports.begin(), ports.end(),
                                 [&](const std::string& port) {
                                   return hasPrefix(port, prefix);
                                 });
    if (it != ports.end()) {
      return *it;
    }
  }
  return std::nullopt;
}

char SerialPortLink::parseLineTerminator(const std::string& token) {
  if (token == "\\n") {
    return '\n';
  }
  if (token == "\\r") {
    return '\r';
  }
  if (token.empty()) {
    return '\n';
  }
  return token.front();
}
