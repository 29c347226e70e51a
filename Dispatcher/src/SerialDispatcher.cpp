#include "SerialDispatcher.hpp"

#include <Config.hpp>
#include <GcodeCommandBuilder.hpp>
#include <Logger.hpp>
#include <SerialLinkFactory.hpp>
#include <SteadyClockAdapter.hpp>

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>
#include <stdexcept>

namespace {
std::string normalizeCommand(const std::string& text) {
  auto isBlank = [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };
  const auto first = std::find_if_not(text.begin(), text.end(), isBlank);
  const auto last = std::find_if_not(text.rbegin(), text.rend(), isBlank).base();
  if (first >= last) {
    return {};
  }
  return {first, last};
}
}  // namespace

SerialDispatcher::Options SerialDispatcher::Options::fromYaml(
    const YAML::Node& dispatcherConfig) {
  Options options;
  if (!dispatcherConfig || !dispatcherConfig.IsMap()) {
    return options;
  }
  options.worker = SerialWorker::Options::fromYaml(dispatcherConfig["worker"]);
  if (const auto timeout = dispatcherConfig["shutdownTimeoutMS"]) {
    const auto ms = timeout.as<long long>();
    if (ms <= 0) {
      throw std::runtime_error("shutdownTimeoutMS must be positive.");
    }
    options.shutdownTimeout = std::chrono::milliseconds{ms};
  }
  return options;
}

SerialDispatcher::SerialDispatcher(std::unique_ptr<ISerialLink> link,
                                   Callbacks callbacks)
    : SerialDispatcher(std::move(link), std::move(callbacks), Options{}) {}

SerialDispatcher::SerialDispatcher(std::unique_ptr<ISerialLink> link,
                                   Callbacks callbacks, Options options,
                                   std::unique_ptr<IClock> clock)
    : _link(std::move(link)),
      _callbacks(std::move(callbacks)),
      _options(std::move(options)),
      _clock(std::move(clock)) {
  if (!_link) {
    throw std::runtime_error("SerialDispatcher serial link is null.");
  }
  if (!_clock) {
    _clock = std::make_unique<SteadyClockAdapter>();
  }
}

SerialDispatcher::~SerialDispatcher() {
  try {
    disconnect();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("Exception during SerialDispatcher destruction: {}",
                 e.what());
  }
  reapWorker();
}

std::unique_ptr<SerialDispatcher> SerialDispatcher::fromConfig(
    Callbacks callbacks) {
  auto& cfg = utl::Config::instance();
  const auto dispatcherCfg = cfg.getClassConfig("SerialDispatcher");
  auto link = makeSerialLink(cfg.getRequired<YAML::Node>("SerialDispatcher", "link"));
  return std::make_unique<SerialDispatcher>(
      std::move(link), std::move(callbacks), Options::fromYaml(dispatcherCfg));
}

void SerialDispatcher::connect(const std::string& port,
                               const unsigned int baudRate) {
  if (auto* self = SerialWorker::current();
      self != nullptr &&
      self == _activeWorker.load(std::memory_order_acquire)) {
    throw ConnectError(EConnectErrorReason::AlreadyConnected,
                       "Cannot reconnect from inside a serial callback");
  }

  std::optional<ConnectError> failure;
  {
    std::lock_guard<std::mutex> transition(_transitionMutex);
    const auto current = state();
    if (current != utl::EConnectionState::Disconnected) {
      throw ConnectError(
          EConnectErrorReason::AlreadyConnected,
          fmt::format("Cannot connect to '{}' while {}", port,
                      magic_enum::enum_name(current)));
    }
    reapWorker();

    setState(utl::EConnectionState::Connecting);
    SPDLOG_INFO("Connecting to {} at {} baud", port, baudRate);
    try {
      if (baudRate == 0) {
        throw ConnectError(EConnectErrorReason::InvalidBaud,
                           "Baud rate must be positive.");
      }
      _link->open(port, baudRate);
    } catch (const ConnectError& e) {
      failure = e;
    } catch (const std::exception& e) {
      failure = ConnectError(
          EConnectErrorReason::PortUnavailable,
          fmt::format("Connection to '{}' failed: {}", port, e.what()));
    }

    if (failure) {
      _link->closeNoThrow();
      setState(utl::EConnectionState::Disconnected);
      SPDLOG_ERROR("Connection to {} failed: {}", port, failure->what());
    } else {
      discardQueued("stale from a previous session");
      {
        std::lock_guard<std::mutex> lock(_infoMutex);
        _port = port;
        _baudRate = baudRate;
      }
      _worker = std::make_unique<SerialWorker>(*_link, _queue, *_clock,
                                               _options.worker);
      _activeWorker.store(_worker.get(), std::memory_order_release);
      setState(utl::EConnectionState::Connected);
      SPDLOG_INFO("Connected to {} at {} baud", port, baudRate);
      _worker->start(SerialWorker::Listener{
          .onStarted = [this]() { notify(_callbacks.onConnected, "onConnected"); },
          .onLine =
              [this](const std::string& line) {
                notify(_callbacks.onDataReceived, "onDataReceived", line);
              },
          .onFailure =
              [this](const std::string& message) { handleWorkerFailure(message); },
          .onStopped = [this]() { handleWorkerStopped(); }});
    }
  }

  if (failure) {
    notify(_callbacks.onError, "onError", failure->what());
    throw *failure;
  }
}

void SerialDispatcher::disconnect() {
  if (auto* self = SerialWorker::current();
      self != nullptr &&
      self == _activeWorker.load(std::memory_order_acquire)) {
    // Called from one of our own callbacks: the worker cannot wait for
    // itself, so it finishes the teardown once it leaves the loop.
    auto expected = utl::EConnectionState::Connected;
    if (_state.compare_exchange_strong(expected,
                                       utl::EConnectionState::Disconnecting,
                                       std::memory_order_acq_rel)) {
      SPDLOG_INFO("Disconnect requested from a serial callback");
      _stopFromCallback.store(true, std::memory_order_release);
      self->requestStop();
    }
    return;
  }

  bool timedOut = false;
  {
    std::lock_guard<std::mutex> transition(_transitionMutex);
    const auto current = state();
    if (current != utl::EConnectionState::Connected) {
      // Error and Disconnecting here belong to a transition the worker is
      // finishing on its own (connection loss or a callback-initiated
      // disconnect); it reports that transition itself.
      reapWorker();
      return;
    }

    setState(utl::EConnectionState::Disconnecting);
    const auto port = currentPort().value_or("unknown port");
    SPDLOG_INFO("Disconnecting from {}", port);

    if (_worker) {
      _worker->requestStop();
      if (!_worker->waitForExit(_options.shutdownTimeout)) {
        timedOut = true;
        SPDLOG_ERROR("Serial worker did not stop within {} ms, force-closing {}",
                     _options.shutdownTimeout.count(), port);
        _link->closeNoThrow();
      }
      _worker->join();
      _activeWorker.store(nullptr, std::memory_order_release);
      _worker.reset();
    }
    finishTeardown("on disconnect");
  }

  if (timedOut) {
    notify(_callbacks.onError, "onError",
           fmt::format("Serial worker did not stop within {} ms; port was "
                       "force-closed",
                       _options.shutdownTimeout.count()));
  }
  notify(_callbacks.onDisconnected, "onDisconnected");
}

void SerialDispatcher::sendCommand(const std::string& text,
                                   const bool priority) {
  if (state() != utl::EConnectionState::Connected) {
    throw NotConnectedError(
        fmt::format("Cannot send '{}': not connected", text));
  }
  auto payload = normalizeCommand(text);
  if (payload.empty()) {
    throw std::invalid_argument("Refusing to send an empty command.");
  }
  _queue.push(cmd::Command{.payload = std::move(payload),
                           .priority = priority,
                           .enqueuedAt = _clock->now()});
}

void SerialDispatcher::requestStatusUpdate() {
  sendCommand(GcodeCommandBuilder::queryPosition(), true);
  sendCommand(GcodeCommandBuilder::queryEndstops(), true);
  SPDLOG_DEBUG("Requested position (M114) and endstop status (M119)");
}

bool SerialDispatcher::isOpen() const {
  return state() == utl::EConnectionState::Connected;
}

std::optional<std::string> SerialDispatcher::currentPort() const {
  std::lock_guard<std::mutex> lock(_infoMutex);
  return _port;
}

std::optional<unsigned int> SerialDispatcher::currentBaudRate() const {
  std::lock_guard<std::mutex> lock(_infoMutex);
  return _baudRate;
}

void SerialDispatcher::handleWorkerFailure(const std::string& message) {
  auto expected = utl::EConnectionState::Connected;
  if (!_state.compare_exchange_strong(expected, utl::EConnectionState::Error,
                                      std::memory_order_acq_rel)) {
    SPDLOG_WARN("Serial failure while {}: {}", magic_enum::enum_name(expected),
                message);
    handleWorkerStopped();
    return;
  }
  SPDLOG_ERROR("Connection lost: {}", message);
  _link->closeNoThrow();
  discardQueued("after connection loss");
  clearConnectionInfo();
  // Still Error while onError runs, so a reconnect attempt from inside the
  // callback is refused instead of racing this worker's exit.
  notify(_callbacks.onError, "onError", message);
  setState(utl::EConnectionState::Disconnected);
}

void SerialDispatcher::handleWorkerStopped() {
  if (!_stopFromCallback.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  finishTeardown("on disconnect");
  notify(_callbacks.onDisconnected, "onDisconnected");
}

void SerialDispatcher::finishTeardown(const char* reason) {
  _link->closeNoThrow();
  discardQueued(reason);
  clearConnectionInfo();
  setState(utl::EConnectionState::Disconnected);
  SPDLOG_INFO("Disconnected");
}

void SerialDispatcher::clearConnectionInfo() {
  std::lock_guard<std::mutex> lock(_infoMutex);
  _port.reset();
  _baudRate.reset();
}

void SerialDispatcher::reapWorker() {
  if (!_worker) {
    return;
  }
  _worker->requestStop();
  _worker->join();
  _activeWorker.store(nullptr, std::memory_order_release);
  _worker.reset();
}

void SerialDispatcher::discardQueued(const char* reason) {
  if (const auto discarded = _queue.clear(); discarded > 0) {
    SPDLOG_WARN("Discarded {} queued command(s) {}", discarded, reason);
  }
}

void SerialDispatcher::setState(const utl::EConnectionState state) {
  const auto previous = _state.exchange(state, std::memory_order_acq_rel);
  if (previous != state) {
    SPDLOG_DEBUG("Connection state {} -> {}", magic_enum::enum_name(previous),
                 magic_enum::enum_name(state));
  }
}

void SerialDispatcher::notify(const std::function<void()>& callback,
                              const char* name) {
  if (!callback) {
    return;
  }
  try {
    callback();
  } catch (const std::exception& e) {
    SPDLOG_ERROR("{} callback threw: {}", name, e.what());
  }
}

void SerialDispatcher::notify(
    const std::function<void(const std::string&)>& callback, const char* name,
    const std::string& argument) {
  if (!callback) {
    return;
  }
  try {
    callback(argument);
  } catch (const std::exception& e) {
    SPDLOG_ERROR("{} callback threw: {}", name, e.what());
  }
}
