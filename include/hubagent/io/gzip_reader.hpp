#pragma once

#include "hubagent/io/io.hpp"

#include <memory>
#include <vector>
#include <zlib.h>

namespace hubagent {

class GzipReader final : public IReader {
  public:
    explicit GzipReader(std::unique_ptr<IReader> source);
    ~GzipReader() override;

    GzipReader(const GzipReader&) = delete;
    GzipReader& operator=(const GzipReader&) = delete;

    // Implementation of IReader
    ssize_t Read(std::span<std::uint8_t> out) override;
    std::optional<std::uint64_t> TotalSize() const override { return std::nullopt; }

    // True once the gzip trailer has been consumed; a zero Read() without
    // this means the compressed input was truncated.
    bool Finished() const { return eof_reached_; }

  private:
    std::unique_ptr<IReader> source_;
    z_stream strm_{};
    std::vector<std::uint8_t> in_buffer_;
    bool eof_reached_ = false;
};

} // namespace hubagent
