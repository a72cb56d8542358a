#pragma once
#include "runtime.h"

#include <cstddef>

namespace toolgate {

// Process-wide SIGINT/SIGTERM handling for every Client in the global
// runtime. The signal handler only writes to a self-pipe; a watcher thread
// does the draining and then ends the process with status 0.
class ShutdownCoordinator {
public:
    // Idempotent; at most one registration per process.
    static void install();
    static bool installed();

    // Closes every registered client concurrently and waits for all of them.
    // Individual failures are logged, never thrown. Returns how many clients
    // were asked to close.
    static size_t drain(ClientRuntime& rt);
};

} // namespace toolgate
