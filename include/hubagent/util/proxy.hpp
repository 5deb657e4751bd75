#pragma once

#include "hubagent/util/agent_config.hpp"

#include <string>

namespace hubagent {

// http://[user:password@]server:port
std::string ProxyUrl(const ProxyConfig& proxy);

// Exports HTTP_PROXY for the configured proxy. Does nothing when no proxy
// server is configured or when HTTP_PROXY is already set.
Result UseProxy(const ProxyConfig& proxy);

} // namespace hubagent
