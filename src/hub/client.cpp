#include "hubagent/hub/client.hpp"

#include "hubagent/io/gzip.hpp"
#include "hubagent/util/logger.hpp"
#include "hubagent/util/version.hpp"

namespace hubagent::hub {

namespace {

std::string DescribeTransportError(const TransportError& err) {
    switch (err.code) {
        case TransportErrorCode::Timeout:   return "timeout: " + err.message;
        case TransportErrorCode::Cancelled: return "cancelled: " + err.message;
        default:                            return err.message;
    }
}

} // namespace

HubClient::HubClient(std::string host, std::string port, std::unique_ptr<ITransport> transport)
    : host_(std::move(host)),
      port_(std::move(port)),
      user_agent_(DefaultUserAgent()),
      transport_(std::move(transport)) {}

std::string HubClient::Url(const std::string& path) const {
    return "https://" + host_ + ":" + port_ + path;
}

std::expected<Request, Error> HubClient::BuildRequest(const std::string& method,
                                                      const std::string& path) const {
    if (path.empty() || path.front() != '/') {
        return std::unexpected(Error::InvalidPath(path));
    }
    Request req;
    req.method = method;
    req.path = path;
    req.url = Url(path);
    return req;
}

std::expected<Request, Error> HubClient::BuildRequest(const std::string& method,
                                                      const std::string& path,
                                                      const nlohmann::json& body) const {
    auto req = BuildRequest(method, path);
    if (!req) return req;

    std::string serialized;
    try {
        serialized = body.dump();
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(Error::Encoding(std::string("cannot serialize body: ") + e.what()));
    }

    auto compressed = CompressGzip(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(serialized.data()), serialized.size()));
    if (!compressed) {
        return std::unexpected(Error::Encoding("cannot compress body: " + compressed.error()));
    }

    req->headers["Content-Type"] = "application/json";
    req->headers["Content-Encoding"] = "gzip";
    req->body = std::move(*compressed);
    return req;
}

std::expected<Request, Error> HubClient::BuildRequest(const std::string& method,
                                                      const std::string& path,
                                                      const RawBody& body) const {
    auto req = BuildRequest(method, path);
    if (!req) return req;
    req->headers["Content-Type"] = body.content_type;
    req->body = body.data;
    return req;
}

std::expected<Response, Error> HubClient::Send(Request request, const CallContext& ctx) const {
    request.headers["User-Agent"] = user_agent_;
    request.headers["Cache-Control"] = "no-cache";

    auto res = transport_->Send(request, ctx);
    if (!res) {
        LogDebug("%s %s: %s", request.method.c_str(), request.path.c_str(),
                 res.error().message.c_str());
        return std::unexpected(Error::Connection(DescribeTransportError(res.error())));
    }
    LogDebug("%s %s -> %d", request.method.c_str(), request.path.c_str(), res->status);
    return std::move(*res);
}

std::expected<void, Error> HubClient::Execute(Request request,
                                              const CallContext& ctx,
                                              nlohmann::json* dst) const {
    auto res = Send(std::move(request), ctx);
    if (!res) return std::unexpected(res.error());

    if (res->status >= 400) {
        return std::unexpected(Error::Http(res->status, std::move(res->body)));
    }
    if (dst == nullptr) return {};

    try {
        *dst = nlohmann::json::parse(res->body);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(Error::Decode(std::string("cannot decode response: ") + e.what()));
    }
    return {};
}

std::expected<void, Error> HubClient::Get(const CallContext& ctx,
                                          const std::string& path,
                                          nlohmann::json* dst) const {
    auto req = BuildRequest(kMethodGet, path);
    if (!req) return std::unexpected(req.error());
    return Execute(std::move(*req), ctx.WithTimeout(kApiCallTimeout), dst);
}

std::expected<void, Error> HubClient::Post(const CallContext& ctx,
                                           const std::string& path,
                                           const nlohmann::json& body,
                                           nlohmann::json* dst) const {
    auto req = BuildRequest(kMethodPost, path, body);
    if (!req) return std::unexpected(req.error());
    return Execute(std::move(*req), ctx.WithTimeout(kApiCallTimeout), dst);
}

std::expected<void, Error> HubClient::Post(const CallContext& ctx,
                                           const std::string& path,
                                           const RawBody& body,
                                           nlohmann::json* dst) const {
    auto req = BuildRequest(kMethodPost, path, body);
    if (!req) return std::unexpected(req.error());
    return Execute(std::move(*req), ctx.WithTimeout(kApiCallTimeout), dst);
}

std::expected<void, Error> HubClient::Put(const CallContext& ctx,
                                          const std::string& path,
                                          const nlohmann::json& body,
                                          nlohmann::json* dst) const {
    auto req = BuildRequest(kMethodPut, path, body);
    if (!req) return std::unexpected(req.error());
    return Execute(std::move(*req), ctx.WithTimeout(kApiCallTimeout), dst);
}

std::expected<void, Error> HubClient::Put(const CallContext& ctx,
                                          const std::string& path,
                                          const RawBody& body,
                                          nlohmann::json* dst) const {
    auto req = BuildRequest(kMethodPut, path, body);
    if (!req) return std::unexpected(req.error());
    return Execute(std::move(*req), ctx.WithTimeout(kApiCallTimeout), dst);
}

std::expected<Response, Error> HubClient::Download(const CallContext& ctx,
                                                   const std::string& path,
                                                   IWriter& sink) const {
    auto req = BuildRequest(kMethodGet, path);
    if (!req) return std::unexpected(req.error());
    req->response_sink = &sink;

    auto res = Send(std::move(*req), ctx);
    if (!res) return res;

    if (res->status != 200) {
        return std::unexpected(Error::Http(res->status, std::move(res->body)));
    }
    return res;
}

} // namespace hubagent::hub
