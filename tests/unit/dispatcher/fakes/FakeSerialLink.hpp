#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <ISerialLink.hpp>
#include <SerialErrors.hpp>

// In-memory serial device. Tests push inbound bytes with feed() and inspect
// what the worker wrote through writtenLines().
class FakeSerialLink final : public ISerialLink {
 public:
  void open(const std::string& port, const unsigned int baudRate) override {
    ++openCalls;
    if (openError) {
      throw ConnectError(*openError, "fake open failure on " + port);
    }
    std::lock_guard<std::mutex> lock(_m);
    _port = port;
    _baudRate = baudRate;
    _open = true;
  }

  void closeNoThrow() noexcept override {
    ++closeCalls;
    {
      std::lock_guard<std::mutex> lock(_m);
      _open = false;
    }
    _cv.notify_all();
  }

  [[nodiscard]] bool isOpen() const override {
    std::lock_guard<std::mutex> lock(_m);
    return _open;
  }

  void writeLine(const std::string& line) override {
    std::lock_guard<std::mutex> lock(_m);
    if (!_open) {
      throw IoError("fake port is not open");
    }
    if (failOnWrite) {
      throw IoError("fake write failure");
    }
    _written.push_back(line);
    if (const auto reply = _replies.find(line); reply != _replies.end()) {
      _inbound += reply->second;
    }
    _cv.notify_all();
  }

  [[nodiscard]] std::string readAvailable() override {
    std::unique_lock<std::mutex> lock(_m);
    if (hangOnRead) {
      _cv.wait(lock, [this] { return !_open; });
      throw IoError("fake port closed while reading");
    }
    _cv.wait_for(lock, std::chrono::milliseconds(5), [this] {
      return !_inbound.empty() || failOnRead || !_open;
    });
    if (failOnRead) {
      throw IoError("fake device unplugged");
    }
    if (!_open) {
      throw IoError("fake port is not open");
    }
    std::string data;
    data.swap(_inbound);
    return data;
  }

  [[nodiscard]] std::string describe() const override {
    std::lock_guard<std::mutex> lock(_m);
    return "fake(" + _port + ")";
  }

  void feed(const std::string& bytes) {
    {
      std::lock_guard<std::mutex> lock(_m);
      _inbound += bytes;
    }
    _cv.notify_all();
  }

  // Queues reply as inbound bytes whenever exactly line is written.
  void replyTo(const std::string& line, const std::string& reply) {
    std::lock_guard<std::mutex> lock(_m);
    _replies[line] = reply;
  }

  void unplug() {
    failOnRead = true;
    _cv.notify_all();
  }

  [[nodiscard]] std::vector<std::string> writtenLines() const {
    std::lock_guard<std::mutex> lock(_m);
    return _written;
  }

  [[nodiscard]] bool wasWritten(const std::string& line) const {
    std::lock_guard<std::mutex> lock(_m);
    for (const auto& written : _written) {
      if (written == line) {
        return true;
      }
    }
    return false;
  }

  [[nodiscard]] unsigned int lastBaudRate() const {
    std::lock_guard<std::mutex> lock(_m);
    return _baudRate;
  }

  std::optional<EConnectErrorReason> openError;
  std::atomic<bool> failOnRead{false};
  std::atomic<bool> failOnWrite{false};
  std::atomic<bool> hangOnRead{false};
  std::atomic<int> openCalls{0};
  std::atomic<int> closeCalls{0};

 private:
  mutable std::mutex _m;
  std::condition_variable _cv;
  bool _open{false};
  std::string _port;
  unsigned int _baudRate{0};
  std::string _inbound;
  std::vector<std::string> _written;
  std::map<std::string, std::string> _replies;
};
