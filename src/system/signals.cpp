// signals.cpp - Shutdown signals and the shared cancel flag.

#include "hubagent/system/signals.hpp"

#include <csignal>

namespace hubagent {

std::atomic_bool g_cancel{false};

static void HandleSignal(int) {
    g_cancel.store(true, std::memory_order_relaxed);
}

void InstallSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = HandleSignal;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART: a sleeping agent loop must wake up.
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

} // namespace hubagent
