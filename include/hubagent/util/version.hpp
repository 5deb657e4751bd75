#pragma once

#include <string>

#ifndef HUBAGENT_VERSION
#define HUBAGENT_VERSION "0.0.0-dev"
#endif

namespace hubagent {

inline constexpr const char* kAgentVersion = HUBAGENT_VERSION;

// "hub-agent/<version>"
inline std::string DefaultUserAgent() {
    return std::string("hub-agent/") + kAgentVersion;
}

} // namespace hubagent
