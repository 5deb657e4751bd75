#pragma once

#include "hubagent/hub/transport.hpp"

#include <memory>
#include <mutex>

namespace hubagent::hub {

// libcurl transport. Every call runs on its own easy handle; connections,
// DNS results and TLS sessions are pooled through one shared handle.
class CurlTransport final : public ITransport {
public:
    explicit CurlTransport(TransportConfig config);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    std::expected<Response, TransportError> Send(const Request& request,
                                                 const CallContext& ctx) override;

    // Installs new trust/client credentials, e.g. the certificate issued at
    // enrollment. Calls already in flight keep the previous settings.
    void UpdateTlsConfig(TlsConfig tls);
    TlsConfig CurrentTlsConfig() const;

private:
    struct Share;

    TransportConfig Snapshot() const;

    mutable std::mutex config_mu_;
    TransportConfig config_;
    std::unique_ptr<Share> share_;
};

} // namespace hubagent::hub
