#pragma once

#include "hubagent/hub/client.hpp"
#include "hubagent/hub/transport.hpp"

#include <atomic>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace hubagent::hub {

// A programmed response; after it is consumed it also records the request
// that consumed it.
class MockResponse {
public:
    MockResponse(int status, std::string body, Headers headers)
        : status_(status), body_(std::move(body)), headers_(std::move(headers)) {}

    bool Called() const { return called_.load(std::memory_order_acquire); }

    // Valid once Called() is true.
    const Request& CapturedRequest() const { return request_; }

    int Status() const { return status_; }

private:
    friend class MockTransport;

    int status_;
    std::string body_;
    Headers headers_;
    Request request_;
    std::atomic_bool called_{false};
};

// FIFO of programmed responses standing in for the network. Send() on an
// empty queue fails at once with NoMoreResponses.
class MockTransport final : public ITransport {
public:
    std::shared_ptr<MockResponse> Enqueue(int status, std::string body, Headers headers = {});

    std::expected<Response, TransportError> Send(const Request& request,
                                                 const CallContext& ctx) override;

    size_t Pending() const;

private:
    mutable std::mutex mu_;
    std::deque<std::shared_ptr<MockResponse>> queue_;
};

// Client wired to a fresh mock; the mock is owned by the client.
std::pair<HubClient, MockTransport*> NewMockedClient();

// Request body as the hub would read it: gunzipped when Content-Encoding is gzip.
std::expected<std::string, std::string> DecodeRequestBody(const Request& request);

} // namespace hubagent::hub
