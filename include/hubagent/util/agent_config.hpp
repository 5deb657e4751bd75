#pragma once

#include "hubagent/util/result.hpp"

#include <cstdint>
#include <string>

#ifndef HUBAGENT_UPDATE_PUBLIC_KEY
#define HUBAGENT_UPDATE_PUBLIC_KEY \
    "xSHbUBG7LTuNfXd3zod4EX8_Es8FTCINgrjvx1WXFE4.plCHzlDAeb3IWW1wK6P6paMRYO4f8qceV3lrNCqNpWo"
#endif

namespace hubagent {

inline constexpr const char* kDefaultConfigPath = "/etc/hub-agent/hub-agent.json";
inline constexpr const char* kDefaultUpdatePublicKey = HUBAGENT_UPDATE_PUBLIC_KEY;
// Upper bound for run_interval_seconds (one day).
inline constexpr std::uint64_t kMaxRunIntervalSeconds = 24 * 60 * 60;

struct ProxyConfig {
    std::string server;
    std::string port;
    std::string user;
    std::string password;
};

struct AgentConfig {
    std::string server;
    std::string port = "443";

    std::string ca_cert;
    std::string client_cert;
    std::string client_key;

    ProxyConfig proxy;

    bool auto_update = false;
    std::uint64_t run_interval_seconds = 300;
    std::string update_public_key = kDefaultUpdatePublicKey;
    std::string log_level;

    static Result LoadFromFile(const std::string& path, AgentConfig& out);
};

} // namespace hubagent
