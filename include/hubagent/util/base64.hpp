#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hubagent {

// Standard alphabet with '=' padding (RFC 4648 section 4).
std::string Base64Encode(std::span<const std::uint8_t> data);
std::expected<std::vector<std::uint8_t>, std::string> Base64Decode(std::string_view in);

// URL-safe alphabet without padding (RFC 4648 section 5, "raw").
std::string Base64RawUrlEncode(std::span<const std::uint8_t> data);
std::expected<std::vector<std::uint8_t>, std::string> Base64RawUrlDecode(std::string_view in);

} // namespace hubagent
