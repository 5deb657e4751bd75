#include "hubagent/agent/agent.hpp"

#include "hubagent/hub/curl_transport.hpp"
#include "hubagent/util/logger.hpp"
#include "hubagent/util/version.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits.h>
#include <thread>
#include <unistd.h>

namespace hubagent {

namespace {

constexpr auto kSleepStep = std::chrono::milliseconds(200);

} // namespace

std::expected<std::string, std::string> CurrentExecutablePath() {
    char buf[PATH_MAX];
    const ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n < 0) {
        return std::unexpected(std::string("readlink /proc/self/exe: ") + std::strerror(errno));
    }
    return std::string(buf, static_cast<size_t>(n));
}

hub::TransportConfig TransportConfigFrom(const AgentConfig& cfg) {
    hub::TransportConfig tc;
    tc.tls.ca_cert_path = cfg.ca_cert;
    tc.tls.client_cert_path = cfg.client_cert;
    tc.tls.client_key_path = cfg.client_key;
    return tc;
}

Agent::Agent(AgentConfig cfg, std::unique_ptr<hub::ITransport> transport, const std::atomic_bool& cancel)
    : cfg_(std::move(cfg)),
      cancel_(cancel),
      client_(cfg_.server, cfg_.port, std::move(transport)),
      verifier_(cfg_.update_public_key),
      updater_(std::make_unique<BinaryUpdater>(client_, verifier_)) {}

std::unique_ptr<Agent> Agent::Create(AgentConfig cfg, const std::atomic_bool& cancel) {
    auto transport = std::make_unique<hub::CurlTransport>(TransportConfigFrom(cfg));
    return std::make_unique<Agent>(std::move(cfg), std::move(transport), cancel);
}

std::chrono::seconds Agent::RunInterval() const {
    return std::chrono::seconds(std::min(cfg_.run_interval_seconds, kMaxRunIntervalSeconds));
}

hub::CallContext Agent::BaseContext() const {
    return hub::CallContext{}.WithCancel(&cancel_);
}

std::expected<UpdateMetadata, UpdateError> Agent::UpdateSelf() {
    std::string target = update_target_;
    if (target.empty()) {
        auto exe = CurrentExecutablePath();
        if (!exe) {
            return std::unexpected(UpdateError::Failed(UpdateErrorCode::Filesystem, exe.error()));
        }
        target = std::move(*exe);
    }
    // One attempt may not outlast the interval between attempts.
    return updater_->Update(BaseContext().WithTimeout(RunInterval()), kAgentBinaryName, target);
}

bool Agent::RunOnce() {
    if (!cfg_.auto_update) {
        LogDebug("auto update disabled");
        return false;
    }

    auto res = UpdateSelf();
    if (!res) {
        // Already logged by the updater with its outcome; next pass retries.
        return false;
    }
    LogInfo("agent updated to version %s, restart required", res->version.c_str());
    return true;
}

bool Agent::SleepInterval() const {
    const auto until = std::chrono::steady_clock::now() + RunInterval();
    while (std::chrono::steady_clock::now() < until) {
        if (cancel_.load(std::memory_order_relaxed)) return false;
        std::this_thread::sleep_for(kSleepStep);
    }
    return !cancel_.load(std::memory_order_relaxed);
}

bool Agent::Run() {
    LogInfo("agent %s started (hub %s:%s, interval %llus)", DefaultUserAgent().c_str(),
            cfg_.server.c_str(), cfg_.port.c_str(),
            static_cast<unsigned long long>(RunInterval().count()));

    while (!cancel_.load(std::memory_order_relaxed)) {
        if (RunOnce()) return true;
        if (!SleepInterval()) break;
    }

    LogInfo("agent stopping");
    return false;
}

} // namespace hubagent
