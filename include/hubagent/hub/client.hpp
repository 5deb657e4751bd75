#pragma once

#include "hubagent/hub/call_context.hpp"
#include "hubagent/hub/error.hpp"
#include "hubagent/hub/http.hpp"
#include "hubagent/hub/transport.hpp"
#include "hubagent/io/io.hpp"

#include <chrono>
#include <expected>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace hubagent::hub {

// Per-call deadline of the JSON API verbs (downloads are not bounded by it).
inline constexpr std::chrono::seconds kApiCallTimeout{60};

// Body sent verbatim, never compressed.
struct RawBody {
    std::vector<std::uint8_t> data;
    std::string content_type = "application/octet-stream";
};

// Verb-level client for the device hub. All methods are const and may be
// called from several threads; the transport carries the shared state.
class HubClient {
public:
    HubClient(std::string host, std::string port, std::unique_ptr<ITransport> transport);

    HubClient(HubClient&&) noexcept = default;
    HubClient& operator=(HubClient&&) noexcept = default;

    const std::string& Host() const { return host_; }
    const std::string& Port() const { return port_; }
    const std::string& UserAgent() const { return user_agent_; }
    void SetUserAgent(std::string user_agent) { user_agent_ = std::move(user_agent); }

    // https://{host}:{port}{path}
    std::string Url(const std::string& path) const;

    std::expected<Request, Error> BuildRequest(const std::string& method,
                                               const std::string& path) const;
    // JSON body: serialized, gzip-compressed, tagged application/json + gzip.
    std::expected<Request, Error> BuildRequest(const std::string& method,
                                               const std::string& path,
                                               const nlohmann::json& body) const;
    std::expected<Request, Error> BuildRequest(const std::string& method,
                                               const std::string& path,
                                               const RawBody& body) const;

    // Adds User-Agent and Cache-Control, then hands the request to the
    // transport. Every transport failure is an ErrorKind::Connection.
    std::expected<Response, Error> Send(Request request, const CallContext& ctx) const;

    // Send, then classify: status >= 400 is Http{status, body}; otherwise the
    // body is decoded into dst when given.
    std::expected<void, Error> Execute(Request request,
                                       const CallContext& ctx,
                                       nlohmann::json* dst = nullptr) const;

    std::expected<void, Error> Get(const CallContext& ctx,
                                   const std::string& path,
                                   nlohmann::json* dst = nullptr) const;
    std::expected<void, Error> Post(const CallContext& ctx,
                                    const std::string& path,
                                    const nlohmann::json& body,
                                    nlohmann::json* dst = nullptr) const;
    std::expected<void, Error> Post(const CallContext& ctx,
                                    const std::string& path,
                                    const RawBody& body,
                                    nlohmann::json* dst = nullptr) const;
    std::expected<void, Error> Put(const CallContext& ctx,
                                   const std::string& path,
                                   const nlohmann::json& body,
                                   nlohmann::json* dst = nullptr) const;
    std::expected<void, Error> Put(const CallContext& ctx,
                                   const std::string& path,
                                   const RawBody& body,
                                   nlohmann::json* dst = nullptr) const;

    // GET streaming a 200 body into sink. The returned response carries the
    // headers; its body is empty.
    std::expected<Response, Error> Download(const CallContext& ctx,
                                            const std::string& path,
                                            IWriter& sink) const;

private:
    std::string host_;
    std::string port_;
    std::string user_agent_;
    std::unique_ptr<ITransport> transport_;
};

} // namespace hubagent::hub
