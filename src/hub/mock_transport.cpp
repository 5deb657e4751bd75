#include "hubagent/hub/mock_transport.hpp"

#include "hubagent/io/gzip.hpp"

namespace hubagent::hub {

std::shared_ptr<MockResponse> MockTransport::Enqueue(int status, std::string body, Headers headers) {
    auto response = std::make_shared<MockResponse>(status, std::move(body), std::move(headers));
    std::lock_guard<std::mutex> lk(mu_);
    queue_.push_back(response);
    return response;
}

size_t MockTransport::Pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    return queue_.size();
}

std::expected<Response, TransportError> MockTransport::Send(const Request& request,
                                                            const CallContext& ctx) {
    if (ctx.Cancelled()) {
        return std::unexpected(TransportError{TransportErrorCode::Cancelled, "request cancelled"});
    }
    if (ctx.Expired()) {
        return std::unexpected(
            TransportError{TransportErrorCode::Timeout, "deadline exceeded before request"});
    }

    std::shared_ptr<MockResponse> mock;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (queue_.empty()) {
            return std::unexpected(
                TransportError{TransportErrorCode::NoMoreResponses, "no more mock responses"});
        }
        mock = std::move(queue_.front());
        queue_.pop_front();
    }

    mock->request_ = request;
    mock->request_.response_sink = nullptr;
    mock->called_.store(true, std::memory_order_release);

    Response response;
    response.status = mock->status_;
    response.headers = mock->headers_;

    if (request.response_sink && mock->status_ < 400) {
        auto r = request.response_sink->WriteAll(std::span<const std::uint8_t>(
            reinterpret_cast<const std::uint8_t*>(mock->body_.data()), mock->body_.size()));
        if (!r.is_ok()) {
            return std::unexpected(
                TransportError{TransportErrorCode::SinkFailed, "response sink: " + r.msg});
        }
    } else {
        response.body = mock->body_;
    }

    return response;
}

std::pair<HubClient, MockTransport*> NewMockedClient() {
    auto mock = std::make_unique<MockTransport>();
    MockTransport* raw = mock.get();
    return {HubClient("hub.test", "443", std::move(mock)), raw};
}

std::expected<std::string, std::string> DecodeRequestBody(const Request& request) {
    if (!request.body) return std::string{};

    auto it = request.headers.find("Content-Encoding");
    if (it == request.headers.end() || it->second != "gzip") {
        return std::string(request.body->begin(), request.body->end());
    }

    auto plain = DecompressGzip(*request.body);
    if (!plain) return std::unexpected(plain.error());
    return std::string(plain->begin(), plain->end());
}

} // namespace hubagent::hub
