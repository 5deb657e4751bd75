#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace hubagent {

// In-memory gzip (RFC 1952) helpers. Failures are reported, never fatal.
std::expected<std::vector<std::uint8_t>, std::string> CompressGzip(std::span<const std::uint8_t> data);
std::expected<std::vector<std::uint8_t>, std::string> DecompressGzip(std::span<const std::uint8_t> data);

} // namespace hubagent
