#pragma once

#include "hubagent/io/io.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hubagent::hub {

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(
            a.begin(), a.end(), b.begin(), b.end(), [](unsigned char x, unsigned char y) {
                return std::tolower(x) < std::tolower(y);
            });
    }
};

using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;

inline constexpr const char* kMethodGet = "GET";
inline constexpr const char* kMethodPost = "POST";
inline constexpr const char* kMethodPut = "PUT";

// Request envelope. Transport headers (User-Agent, Cache-Control) are added
// by HubClient::Send, so a built request can still be inspected or changed.
struct Request {
    std::string method;
    std::string path;
    std::string url;
    Headers headers;
    std::optional<std::vector<std::uint8_t>> body;

    // When set, bodies of responses with status < 400 are streamed here
    // instead of being buffered in Response::body.
    IWriter* response_sink = nullptr;
};

struct Response {
    int status = 0;
    Headers headers;
    std::string body;

    std::string Header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? std::string{} : it->second;
    }
};

} // namespace hubagent::hub
