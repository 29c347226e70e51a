#pragma once

#include <stdexcept>
#include <string>

enum class EConnectErrorReason {
  PortUnavailable,
  InvalidBaud,
  InvalidParameters,
  AlreadyConnected
};

// Raised synchronously by connect() and ISerialLink::open().
class ConnectError : public std::runtime_error {
 public:
  ConnectError(const EConnectErrorReason reason, const std::string& message)
      : std::runtime_error(message), _reason(reason) {}

  [[nodiscard]] EConnectErrorReason reason() const noexcept { return _reason; }

 private:
  EConnectErrorReason _reason;
};

// Raised by sendCommand() while the dispatcher is not connected.
class NotConnectedError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Mid-session read/write failure. Never crosses the dispatcher API
// synchronously, the worker reports it through onError.
class IoError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};
