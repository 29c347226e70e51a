#include "SerialWorker.hpp"

#include <Logger.hpp>
#include <ResponseClassifier.hpp>
#include <SerialErrors.hpp>

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <optional>
#include <stdexcept>

namespace {
thread_local SerialWorker* tCurrentWorker = nullptr;

std::string toUpper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

std::chrono::milliseconds readMillis(const YAML::Node& node, const char* key,
                                     const std::chrono::milliseconds fallback) {
  const auto value = node[key];
  if (!value) {
    return fallback;
  }
  try {
    const auto ms = value.as<long long>();
    if (ms < 0) {
      throw std::runtime_error(
          fmt::format("Worker setting '{}' must not be negative", key));
    }
    return std::chrono::milliseconds{ms};
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(
        fmt::format("Invalid worker setting '{}': {}", key, e.what()));
  }
}

long long toMillis(const IClock::duration d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}
}  // namespace

SerialWorker::Options SerialWorker::Options::fromYaml(
    const YAML::Node& workerConfig) {
  Options options;
  if (!workerConfig || workerConfig.IsNull()) {
    return options;
  }
  if (!workerConfig.IsMap()) {
    throw std::runtime_error("Serial worker config must be a map.");
  }

  options.idleSleep =
      std::max(std::chrono::milliseconds{1},
               readMillis(workerConfig, "idleSleepMS", options.idleSleep));
  options.blockingMinPause = readMillis(workerConfig, "blockingMinPauseMS",
                                        options.blockingMinPause);
  options.blockingMaxPause = readMillis(workerConfig, "blockingMaxPauseMS",
                                        options.blockingMaxPause);
  options.statusRequestInterval = readMillis(
      workerConfig, "statusRequestIntervalMS", options.statusRequestInterval);
  options.endstopRequestInterval = readMillis(
      workerConfig, "endstopRequestIntervalMS", options.endstopRequestInterval);

  if (const auto blocking = workerConfig["blockingCommands"]) {
    if (!blocking.IsSequence()) {
      throw std::runtime_error(
          "Worker setting 'blockingCommands' must be a sequence.");
    }
    options.blockingCommands.clear();
    for (const auto& entry : blocking) {
      options.blockingCommands.push_back(toUpper(entry.as<std::string>()));
    }
  }

  if (options.blockingMinPause > options.blockingMaxPause) {
    throw std::runtime_error(fmt::format(
        "blockingMinPauseMS ({}) exceeds blockingMaxPauseMS ({})",
        options.blockingMinPause.count(), options.blockingMaxPause.count()));
  }
  return options;
}

SerialWorker::SerialWorker(ISerialLink& link, cmd::CommandQueue& queue,
                           IClock& clock, Options options)
    : _link(link),
      _queue(queue),
      _clock(clock),
      _options(std::move(options)),
      _exitedFuture(_exited.get_future().share()) {
  for (auto& prefix : _options.blockingCommands) {
    prefix = toUpper(prefix);
  }
}

SerialWorker::~SerialWorker() {
  requestStop();
  if (!_thread.joinable()) {
    return;
  }
  if (isWorkerThread()) {
    SPDLOG_WARN("Serial worker destroyed from its own thread, detaching.");
    _thread.detach();
    return;
  }
  _thread.join();
}

void SerialWorker::start(Listener listener) {
  if (_thread.joinable()) {
    SPDLOG_WARN("Serial worker thread already running.");
    return;
  }
  _listener = std::move(listener);
  _stopRequested.store(false, std::memory_order_release);
  _thread = std::thread(&SerialWorker::runner, this);
}

void SerialWorker::requestStop() {
  _stopRequested.store(true, std::memory_order_release);
}

bool SerialWorker::waitForExit(const std::chrono::milliseconds timeout) {
  if (!_thread.joinable()) {
    return true;
  }
  return _exitedFuture.wait_for(timeout) == std::future_status::ready;
}

void SerialWorker::join() {
  if (_thread.joinable() && !isWorkerThread()) {
    _thread.join();
  }
}

bool SerialWorker::isWorkerThread() const {
  return _thread.get_id() == std::this_thread::get_id();
}

SerialWorker* SerialWorker::current() { return tCurrentWorker; }

void SerialWorker::runner() {
  tCurrentWorker = this;
  SPDLOG_INFO("Serial worker started on {}", _link.describe());
  if (_listener.onStarted) {
    _listener.onStarted();
  }

  std::optional<std::string> failure;
  try {
    while (!_stopRequested.load(std::memory_order_acquire)) {
      if (runOnce()) {
        continue;
      }
      if (awaitingAcknowledgement()) {
        std::this_thread::sleep_for(_options.idleSleep);
      } else {
        (void)_queue.wait_for_command(_options.idleSleep);
      }
    }
  } catch (const IoError& e) {
    failure = e.what();
  } catch (const std::exception& e) {
    failure = fmt::format("Unexpected serial worker failure: {}", e.what());
  }

  _link.closeNoThrow();
  if (failure && !_stopRequested.load(std::memory_order_acquire)) {
    SPDLOG_ERROR("Serial worker terminated: {}", *failure);
    if (_listener.onFailure) {
      _listener.onFailure(*failure);
    }
  } else {
    if (failure) {
      SPDLOG_WARN("Serial I/O failure while stopping: {}", *failure);
    }
    SPDLOG_INFO("Serial worker stopped");
    if (_listener.onStopped) {
      _listener.onStopped();
    }
  }
  tCurrentWorker = nullptr;
  _exited.set_value();
}

bool SerialWorker::runOnce() {
  bool didWork = false;

  auto command = awaitingAcknowledgement() ? _queue.pop_priority()
                                           : _queue.pop_next();
  if (command) {
    transmit(*command, _clock.now());
    didWork = true;
  }

  const auto data = _link.readAvailable();
  if (!data.empty()) {
    didWork = true;
    const auto now = _clock.now();
    for (const auto& line : _assembler.feed(data)) {
      handleLine(line, now);
    }
  }

  const auto now = _clock.now();
  checkBlockingTimeout(now);
  scheduleStatusRequests(now);
  return didWork;
}

void SerialWorker::transmit(const cmd::Command& command,
                            const IClock::time_point now) {
  _link.writeLine(command.payload);
  SPDLOG_DEBUG("Serial -> {}{}", command.payload,
               command.priority ? " (priority)" : "");
  if (!isBlockingCommand(command.payload)) {
    return;
  }
  _awaitingCommand = command.payload;
  _awaitingSince = now;
  _awaitingAck.store(true, std::memory_order_release);
  SPDLOG_INFO("Holding normal commands until '{}' is acknowledged",
              _awaitingCommand);
}

void SerialWorker::handleLine(const std::string& line,
                              const IClock::time_point now) {
  SPDLOG_TRACE("Serial <- {}", line);
  if (_listener.onLine) {
    _listener.onLine(line);
  }
  if (!awaitingAcknowledgement() ||
      !ResponseClassifier::isAcknowledgement(line)) {
    return;
  }

  const auto elapsed = now - _awaitingSince;
  if (elapsed < _options.blockingMinPause) {
    SPDLOG_DEBUG("Got 'ok' {} ms after '{}', need {} ms, still waiting",
                 toMillis(elapsed), _awaitingCommand,
                 _options.blockingMinPause.count());
    return;
  }
  _awaitingAck.store(false, std::memory_order_release);
  SPDLOG_INFO("'{}' acknowledged after {} ms, releasing normal commands",
              _awaitingCommand, toMillis(elapsed));
  requestImmediateStatus(now);
}

void SerialWorker::checkBlockingTimeout(const IClock::time_point now) {
  if (!awaitingAcknowledgement()) {
    return;
  }
  const auto waited = now - _awaitingSince;
  if (waited < _options.blockingMaxPause) {
    return;
  }
  _awaitingAck.store(false, std::memory_order_release);
  SPDLOG_WARN("No acknowledgement for '{}' after {} ms (max {} ms), "
              "releasing normal commands",
              _awaitingCommand, toMillis(waited),
              _options.blockingMaxPause.count());
  requestImmediateStatus(now);
}

void SerialWorker::scheduleStatusRequests(const IClock::time_point now) {
  if (!pollingEnabled() || awaitingAcknowledgement()) {
    return;
  }
  if (!_pollingScheduled) {
    _nextStatusAt = now + _options.statusRequestInterval;
    _nextEndstopAt = now + _options.endstopRequestInterval;
    _pollingScheduled = true;
    return;
  }
  if (_options.statusRequestInterval.count() > 0 && now >= _nextStatusAt) {
    enqueueStatusCommand("M114", now);
    _nextStatusAt = now + _options.statusRequestInterval;
  }
  if (_options.endstopRequestInterval.count() > 0 && now >= _nextEndstopAt) {
    enqueueStatusCommand("M119", now);
    _nextEndstopAt = now + _options.endstopRequestInterval;
  }
}

void SerialWorker::requestImmediateStatus(const IClock::time_point now) {
  if (!pollingEnabled()) {
    return;
  }
  if (_options.statusRequestInterval.count() > 0) {
    enqueueStatusCommand("M114", now);
    _nextStatusAt = now + _options.statusRequestInterval;
  }
  if (_options.endstopRequestInterval.count() > 0) {
    enqueueStatusCommand("M119", now);
    _nextEndstopAt = now + _options.endstopRequestInterval;
  }
  _pollingScheduled = true;
}

void SerialWorker::enqueueStatusCommand(const char* payload,
                                        const IClock::time_point now) {
  _queue.push(cmd::Command{.payload = payload, .priority = true, .enqueuedAt = now});
}

bool SerialWorker::isBlockingCommand(const std::string& payload) const {
  const auto upper = toUpper(payload);
  for (const auto& prefix : _options.blockingCommands) {
    if (prefix.empty() || upper.rfind(prefix, 0) != 0) {
      continue;
    }
    if (upper.size() == prefix.size() ||
        !std::isdigit(static_cast<unsigned char>(upper[prefix.size()]))) {
      return true;
    }
  }
  return false;
}

bool SerialWorker::pollingEnabled() const {
  return _options.statusRequestInterval.count() > 0 ||
         _options.endstopRequestInterval.count() > 0;
}
