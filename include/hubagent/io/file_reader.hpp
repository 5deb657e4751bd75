#pragma once

#include "hubagent/io/fd.hpp"
#include "hubagent/io/io.hpp"
#include "hubagent/util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace hubagent {

class FileReader final : public IReader {
public:
    static Result Open(std::string path, FileReader& out);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

} // namespace hubagent
