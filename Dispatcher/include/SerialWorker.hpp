#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "CommandQueue.hpp"
#include "IClock.hpp"
#include "ISerialLink.hpp"
#include "LineAssembler.hpp"

// Background I/O loop for one open connection: drains the command queue
// into the link and turns inbound bytes into lines.
class SerialWorker {
 public:
  struct Options {
    std::chrono::milliseconds idleSleep{2};
    // Commands whose first token matches hold back the normal lane until the
    // firmware acknowledges them.
    std::vector<std::string> blockingCommands{"G28", "G29", "M999"};
    // An "ok" earlier than this after a blocking command is not its ack.
    std::chrono::milliseconds blockingMinPause{250};
    std::chrono::milliseconds blockingMaxPause{90000};
    // Zero disables the periodic M114 / M119 requests.
    std::chrono::milliseconds statusRequestInterval{0};
    std::chrono::milliseconds endstopRequestInterval{0};

    static Options fromYaml(const YAML::Node& workerConfig);
  };

  // Invoked on the worker thread. onStarted comes first; exactly one of
  // onFailure (link died) or onStopped (stop was requested) comes last.
  struct Listener {
    std::function<void()> onStarted;
    std::function<void(const std::string&)> onLine;
    std::function<void(const std::string&)> onFailure;
    std::function<void()> onStopped;
  };

  SerialWorker(ISerialLink& link, cmd::CommandQueue& queue, IClock& clock,
               Options options);
  ~SerialWorker();

  SerialWorker(const SerialWorker&) = delete;
  SerialWorker& operator=(const SerialWorker&) = delete;

  void start(Listener listener);
  void requestStop();
  // False if the thread is still running after timeout.
  [[nodiscard]] bool waitForExit(std::chrono::milliseconds timeout);
  void join();
  [[nodiscard]] bool isWorkerThread() const;
  // The worker whose thread is calling, or nullptr.
  [[nodiscard]] static SerialWorker* current();

  // One loop iteration; returns whether anything was sent or received.
  // Throws IoError on link failure.
  bool runOnce();

  [[nodiscard]] bool awaitingAcknowledgement() const {
    return _awaitingAck.load(std::memory_order_acquire);
  }
  [[nodiscard]] const Options& options() const { return _options; }

 private:
  void runner();
  void transmit(const cmd::Command& command, IClock::time_point now);
  void handleLine(const std::string& line, IClock::time_point now);
  void checkBlockingTimeout(IClock::time_point now);
  void scheduleStatusRequests(IClock::time_point now);
  void requestImmediateStatus(IClock::time_point now);
  void enqueueStatusCommand(const char* payload, IClock::time_point now);
  [[nodiscard]] bool isBlockingCommand(const std::string& payload) const;
  [[nodiscard]] bool pollingEnabled() const;

  ISerialLink& _link;
  cmd::CommandQueue& _queue;
  IClock& _clock;
  Options _options;
  LineAssembler _assembler;

  Listener _listener;

  std::atomic<bool> _stopRequested{false};
  std::atomic<bool> _awaitingAck{false};
  std::string _awaitingCommand;
  IClock::time_point _awaitingSince{};
  IClock::time_point _nextStatusAt{};
  IClock::time_point _nextEndstopAt{};
  bool _pollingScheduled{false};

  std::promise<void> _exited;
  std::shared_future<void> _exitedFuture;
  std::thread _thread;
};
