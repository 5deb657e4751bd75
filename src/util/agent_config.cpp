#include "hubagent/util/agent_config.hpp"

#include "hubagent/util/logger.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

namespace hubagent {

namespace {

// Absent keys keep their default; present keys of the wrong type are errors.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out,
                        std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::uint64_t& out,
                     std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v < 0) {
        err = std::string(key) + " must not be negative";
        return false;
    }
    out = static_cast<std::uint64_t>(v);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, bool& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool FillFromJson(const nlohmann::json& j, AgentConfig& cfg, std::string& err) {
    // The hub port is a string in the config format; a number is accepted too.
    if (auto it = j.find("port"); it != j.end() && it->is_number_unsigned()) {
        cfg.port = std::to_string(it->get<std::uint64_t>());
    } else if (!GetStringIfPresent(j, "port", cfg.port, err)) {
        return false;
    }

    return GetStringIfPresent(j, "server", cfg.server, err) &&
           GetStringIfPresent(j, "ca_cert", cfg.ca_cert, err) &&
           GetStringIfPresent(j, "client_cert", cfg.client_cert, err) &&
           GetStringIfPresent(j, "client_key", cfg.client_key, err) &&
           GetStringIfPresent(j, "http_proxy_server", cfg.proxy.server, err) &&
           GetStringIfPresent(j, "http_proxy_port", cfg.proxy.port, err) &&
           GetStringIfPresent(j, "http_proxy_user", cfg.proxy.user, err) &&
           GetStringIfPresent(j, "http_proxy_pass", cfg.proxy.password, err) &&
           GetBoolIfPresent(j, "auto_update", cfg.auto_update, err) &&
           GetU64IfPresent(j, "run_interval_seconds", cfg.run_interval_seconds, err) &&
           GetStringIfPresent(j, "update_public_key", cfg.update_public_key, err) &&
           GetStringIfPresent(j, "log_level", cfg.log_level, err);
}

} // namespace

Result AgentConfig::LoadFromFile(const std::string& path, AgentConfig& out) {
    out = AgentConfig{};

    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(-1, "cannot open agent config: " + path);
    }

    nlohmann::json j;
    try {
        is >> j;
    } catch (const std::exception& e) {
        return Result::Fail(-1, std::string("invalid JSON in ") + path + ": " + e.what());
    }

    if (!j.is_object()) {
        return Result::Fail(-1, "agent config must be JSON object: " + path);
    }

    std::string err;
    if (!FillFromJson(j, out, err)) {
        return Result::Fail(-1, "agent config " + path + ": " + err);
    }

    if (out.server.empty()) {
        return Result::Fail(-1, "agent config missing server");
    }
    if (out.port.empty()) {
        return Result::Fail(-1, "agent config has empty port");
    }
    if (out.run_interval_seconds == 0) {
        return Result::Fail(-1, "run_interval_seconds must be greater than 0");
    }
    if (out.run_interval_seconds > kMaxRunIntervalSeconds) {
        return Result::Fail(-1, "run_interval_seconds must not exceed " +
                                    std::to_string(kMaxRunIntervalSeconds));
    }
    if (out.client_cert.empty() != out.client_key.empty()) {
        return Result::Fail(-1, "client_cert and client_key must be given together");
    }
    if (out.update_public_key.empty()) {
        return Result::Fail(-1, "agent config has empty update_public_key");
    }
    if (!out.log_level.empty() && !ParseLogLevel(out.log_level)) {
        return Result::Fail(-1, "unknown log_level: " + out.log_level);
    }

    return Result::Ok();
}

} // namespace hubagent
