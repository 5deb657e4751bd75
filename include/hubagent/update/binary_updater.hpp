#pragma once

#include "hubagent/crypto/signature_verifier.hpp"
#include "hubagent/hub/call_context.hpp"
#include "hubagent/hub/client.hpp"
#include "hubagent/update/metadata.hpp"
#include "hubagent/update/update_error.hpp"

#include <expected>
#include <map>
#include <mutex>
#include <string>

namespace hubagent {

enum class UpdateState {
    Requested,
    Staging,
    Verifying,
    Installed,
    Rejected,
    Failed,
};

const char* ToString(UpdateState state);

// Architecture segment of the download path: amd64, arm64, arm, 386, ...
std::string HostArchitecture();

// "/v1/org/device/auth/download/<name>/<arch>"
std::string BinaryDownloadPath(const std::string& name, const std::string& arch);

// Downloads a named binary from the hub, verifies it against the metadata
// delivered with it and atomically replaces `destination`. The destination
// is only ever touched by the final rename(2); on any failure it keeps its
// previous content and the staging file is removed.
class BinaryUpdater {
public:
    BinaryUpdater(const hub::HubClient& client, const SignatureVerifier& verifier);

    BinaryUpdater(const BinaryUpdater&) = delete;
    BinaryUpdater& operator=(const BinaryUpdater&) = delete;

    // Attempts for the same destination run one at a time; a second caller
    // waits for the first to finish.
    std::expected<UpdateMetadata, UpdateError> Update(const hub::CallContext& ctx,
                                                      const std::string& name,
                                                      const std::string& destination);

    void SetArchitecture(std::string arch) { arch_ = std::move(arch); }
    const std::string& Architecture() const { return arch_; }

    // Destinations with an attempt running or waiting.
    size_t TrackedDestinations() const;

private:
    struct DestinationLock {
        std::mutex mu;
        size_t users = 0;
    };
    class DestinationGuard;

    std::expected<UpdateMetadata, UpdateError> Run(const hub::CallContext& ctx,
                                                   const std::string& name,
                                                   const std::string& destination);

    const hub::HubClient& client_;
    const SignatureVerifier& verifier_;
    std::string arch_;

    // Entries live only while some attempt holds or waits for them.
    mutable std::mutex table_mu_;
    std::map<std::string, DestinationLock> destination_locks_;
};

} // namespace hubagent
