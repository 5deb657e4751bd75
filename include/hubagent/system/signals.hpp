#pragma once

#include <atomic>

namespace hubagent {

// Set by SIGINT/SIGTERM; polled by the agent loop and in-flight transfers.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace hubagent
