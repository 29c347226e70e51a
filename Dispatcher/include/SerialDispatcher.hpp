#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <CommonDefinitions.hpp>
#include <yaml-cpp/yaml.h>

#include "CommandQueue.hpp"
#include "IClock.hpp"
#include "ISerialLink.hpp"
#include "SerialErrors.hpp"
#include "SerialWorker.hpp"

// Owns one serial connection, its outbound command queue and the worker
// thread serving it. Framework agnostic: events leave through four plain
// callbacks, invoked from the worker thread (data, I/O errors) or from the
// thread calling connect()/disconnect(). Marshalling them onto a UI thread
// is up to the consumer.
//
// disconnect() from inside a callback only requests the stop; the worker
// completes the teardown and reports onDisconnected after the callback
// returns. connect() from inside any callback is refused with
// AlreadyConnected.
class SerialDispatcher {
 public:
  struct Callbacks {
    std::function<void(const std::string&)> onDataReceived;
    std::function<void()> onConnected;
    std::function<void()> onDisconnected;
    std::function<void(const std::string&)> onError;
  };

  struct Options {
    SerialWorker::Options worker;
    std::chrono::milliseconds shutdownTimeout{2000};

    static Options fromYaml(const YAML::Node& dispatcherConfig);
  };

  SerialDispatcher(std::unique_ptr<ISerialLink> link, Callbacks callbacks);
  SerialDispatcher(std::unique_ptr<ISerialLink> link, Callbacks callbacks,
                   Options options, std::unique_ptr<IClock> clock = nullptr);
  ~SerialDispatcher();

  SerialDispatcher(const SerialDispatcher&) = delete;
  SerialDispatcher& operator=(const SerialDispatcher&) = delete;

  // Reads 'classes.SerialDispatcher' (link, worker, shutdownTimeoutMS) from
  // the global config.
  [[nodiscard]] static std::unique_ptr<SerialDispatcher> fromConfig(
      Callbacks callbacks);

  // Throws ConnectError. AlreadyConnected is thrown without any callback;
  // an open failure also reports through onError.
  void connect(const std::string& port, unsigned int baudRate);
  void disconnect();
  // Fire-and-forget. Throws NotConnectedError, or std::invalid_argument for
  // a blank line.
  void sendCommand(const std::string& text, bool priority = false);
  // Queues M114 and M119 on the priority lane.
  void requestStatusUpdate();

  [[nodiscard]] bool isOpen() const;
  [[nodiscard]] utl::EConnectionState state() const {
    return _state.load(std::memory_order_acquire);
  }
  [[nodiscard]] std::optional<std::string> currentPort() const;
  [[nodiscard]] std::optional<unsigned int> currentBaudRate() const;
  [[nodiscard]] std::size_t pendingCommands() const { return _queue.size(); }

 private:
  void handleWorkerFailure(const std::string& message);
  void handleWorkerStopped();
  void finishTeardown(const char* reason);
  void clearConnectionInfo();
  void reapWorker();
  void discardQueued(const char* reason);
  void setState(utl::EConnectionState state);
  void notify(const std::function<void()>& callback, const char* name);
  void notify(const std::function<void(const std::string&)>& callback,
              const char* name, const std::string& argument);

  std::unique_ptr<ISerialLink> _link;
  Callbacks _callbacks;
  Options _options;
  std::unique_ptr<IClock> _clock;
  cmd::CommandQueue _queue;
  std::unique_ptr<SerialWorker> _worker;
  std::atomic<SerialWorker*> _activeWorker{nullptr};
  std::atomic<bool> _stopFromCallback{false};

  std::mutex _transitionMutex;
  std::atomic<utl::EConnectionState> _state{
      utl::EConnectionState::Disconnected};

  mutable std::mutex _infoMutex;
  std::optional<std::string> _port;
  std::optional<unsigned int> _baudRate;
};
