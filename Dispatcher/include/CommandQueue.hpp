#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace cmd {

struct Command {
  std::string payload;
  bool priority{false};
  std::chrono::steady_clock::time_point enqueuedAt{};
};

// Two FIFO lanes; the priority lane always drains first.
// Any number of producers, one consumer (the serial worker).
class CommandQueue {
 public:
  void push(Command command);

  // Oldest priority command, else oldest normal command.
  [[nodiscard]] std::optional<Command> pop_next();
  // Oldest priority command only; the normal lane is left untouched.
  [[nodiscard]] std::optional<Command> pop_priority();

  // Blocks up to timeout until some command is queued (or is already).
  bool wait_for_command(std::chrono::milliseconds timeout);

  // Returns how many commands were discarded.
  std::size_t clear();

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t priority_size() const;
  [[nodiscard]] std::size_t normal_size() const;
  [[nodiscard]] bool empty() const;

 private:
  mutable std::mutex _m;
  std::condition_variable _cv;
  std::deque<Command> _priority;
  std::deque<Command> _normal;
};
}  // namespace cmd
