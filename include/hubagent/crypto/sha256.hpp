#pragma once

#include "hubagent/io/io.hpp"

#include <array>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>

namespace hubagent {

using Sha256Digest = std::array<std::uint8_t, 32>;

std::string HexEncode(std::span<const std::uint8_t> bytes);

std::string Sha256Hex(std::span<const std::uint8_t> data);
std::expected<Sha256Digest, std::string> Sha256(IReader& reader);
std::expected<Sha256Digest, std::string> Sha256File(const std::string& path);

class Sha256Hasher {
public:
    Sha256Hasher();
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    ~Sha256Hasher();

    bool Update(std::span<const std::uint8_t> data);
    std::expected<Sha256Digest, std::string> Final();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hubagent
