#include "CommandQueue.hpp"

namespace cmd {

void CommandQueue::push(Command command) {
  {
    std::lock_guard<std::mutex> lock(_m);
    if (command.priority) {
      _priority.push_back(std::move(command));
    } else {
      _normal.push_back(std::move(command));
    }
  }
  _cv.notify_one();
}

std::optional<Command> CommandQueue::pop_next() {
  std::lock_guard<std::mutex> lock(_m);
  auto& lane = _priority.empty() ? _normal : _priority;
  if (lane.empty()) return std::nullopt;
  Command c = std::move(lane.front());
  lane.pop_front();
  return c;
}

std::optional<Command> CommandQueue::pop_priority() {
  std::lock_guard<std::mutex> lock(_m);
  if (_priority.empty()) return std::nullopt;
  Command c = std::move(_priority.front());
  _priority.pop_front();
  return c;
}

bool CommandQueue::wait_for_command(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(_m);
  return _cv.wait_for(lock, timeout, [this] {
    return !_priority.empty() || !_normal.empty();
  });
}

std::size_t CommandQueue::clear() {
  std::lock_guard<std::mutex> lock(_m);
  const auto discarded = _priority.size() + _normal.size();
  _priority.clear();
  _normal.clear();
  return discarded;
}

std::size_t CommandQueue::size() const {
  std::lock_guard<std::mutex> lock(_m);
  return _priority.size() + _normal.size();
}

std::size_t CommandQueue::priority_size() const {
  std::lock_guard<std::mutex> lock(_m);
  return _priority.size();
}

std::size_t CommandQueue::normal_size() const {
  std::lock_guard<std::mutex> lock(_m);
  return _normal.size();
}

bool CommandQueue::empty() const { return size() == 0; }

}  // namespace cmd
