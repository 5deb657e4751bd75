#pragma once

#include "hubagent/hub/call_context.hpp"
#include "hubagent/hub/http.hpp"

#include <chrono>
#include <expected>
#include <string>

namespace hubagent::hub {

enum class TransportErrorCode {
    Failed,          // DNS, TCP, TLS or protocol failure
    Timeout,         // deadline reached before a response was complete
    Cancelled,       // caller cancelled the call
    SinkFailed,      // response sink rejected a write
    NoMoreResponses, // mock transport queue exhausted
};

struct TransportError {
    TransportErrorCode code = TransportErrorCode::Failed;
    std::string message;
};

struct TlsConfig {
    std::string ca_cert_path;     // empty: system trust store
    std::string client_cert_path; // PEM, mutual TLS after enrollment
    std::string client_key_path;  // PEM
};

struct TransportConfig {
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(15)};
    std::chrono::seconds keep_alive{45};
    long max_idle_connections = 5;
    std::chrono::seconds idle_connection_timeout{60};
    // Upper bound for any single transfer, binary downloads included.
    std::chrono::milliseconds transfer_timeout{std::chrono::minutes(45)};
    TlsConfig tls;
    // Empty: use HTTP_PROXY from the environment when present.
    std::string proxy;
};

// Carries one request to the hub and returns its response. Implementations
// must be safe to call from several threads at once.
class ITransport {
public:
    virtual ~ITransport() = default;
    virtual std::expected<Response, TransportError> Send(const Request& request,
                                                         const CallContext& ctx) = 0;
};

} // namespace hubagent::hub
