#pragma once

#include "hubagent/crypto/signature_verifier.hpp"
#include "hubagent/hub/client.hpp"
#include "hubagent/hub/transport.hpp"
#include "hubagent/update/binary_updater.hpp"
#include "hubagent/util/agent_config.hpp"

#include <atomic>
#include <chrono>
#include <expected>
#include <memory>
#include <string>

namespace hubagent {

// Name of the agent's own binary on the hub.
inline constexpr const char* kAgentBinaryName = "agent";

// Resolved target of /proc/self/exe.
std::expected<std::string, std::string> CurrentExecutablePath();

hub::TransportConfig TransportConfigFrom(const AgentConfig& cfg);

// Long-running device agent. Owns the hub client, the signature verifier
// and the binary updater built from one AgentConfig.
class Agent {
public:
    // Throws std::invalid_argument for an unusable update_public_key.
    Agent(AgentConfig cfg, std::unique_ptr<hub::ITransport> transport, const std::atomic_bool& cancel);

    // Agent talking to the configured hub over libcurl.
    static std::unique_ptr<Agent> Create(AgentConfig cfg, const std::atomic_bool& cancel);

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    // Replaces the running executable (or the configured target) with the
    // hub's current agent binary.
    std::expected<UpdateMetadata, UpdateError> UpdateSelf();

    // One scheduled pass. Returns true when a new binary was installed and
    // the process should exit so that the service manager restarts it.
    bool RunOnce();

    // RunOnce every run_interval_seconds until cancelled or a restart is due.
    // Returns true in the latter case.
    bool Run();

    // run_interval_seconds, capped at kMaxRunIntervalSeconds. Also bounds a
    // single UpdateSelf attempt.
    std::chrono::seconds RunInterval() const;

    // Overrides the binary that UpdateSelf replaces.
    void SetUpdateTarget(std::string path) { update_target_ = std::move(path); }

    const AgentConfig& Config() const { return cfg_; }
    const hub::HubClient& Client() const { return client_; }
    BinaryUpdater& Updater() { return *updater_; }

private:
    hub::CallContext BaseContext() const;
    bool SleepInterval() const;

    AgentConfig cfg_;
    const std::atomic_bool& cancel_;
    hub::HubClient client_;
    SignatureVerifier verifier_;
    std::unique_ptr<BinaryUpdater> updater_;
    std::string update_target_;
};

} // namespace hubagent
