#pragma once

#include <atomic>

namespace utl {
// Clears 'running' on SIGINT or SIGTERM. The handlers are installed without
// SA_RESTART, so a blocking read (e.g. std::getline on stdin) returns early
// and the caller gets to check the flag. Throws std::runtime_error if the
// handlers cannot be installed.
void installStopSignalHandlers(std::atomic<bool>& running);
}  // namespace utl
