#include "StopSignals.hpp"

#include <cerrno>
#include <csignal>
#include <signal.h>
#include <cstring>
#include <fmt/format.h>
#include <stdexcept>

namespace {
std::atomic<bool>* gRunning = nullptr;

extern "C" void onStopSignal(int) {
  if (gRunning != nullptr) {
    gRunning->store(false);
  }
}
}  // namespace

namespace utl {
void installStopSignalHandlers(std::atomic<bool>& running) {
  gRunning = &running;

  struct sigaction action {};
  action.sa_handler = onStopSignal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  for (const int signum : {SIGINT, SIGTERM}) {
    if (::sigaction(signum, &action, nullptr) == -1) {
      throw std::runtime_error(
          fmt::format("Cannot install handler for signal {}: {}", signum,
                      std::strerror(errno)));
    }
  }
}
}  // namespace utl
