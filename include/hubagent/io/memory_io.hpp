#pragma once

#include "hubagent/io/io.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace hubagent {

class MemoryReader final : public IReader {
  public:
    explicit MemoryReader(std::string data) : data_(data.begin(), data.end()) {}

    explicit MemoryReader(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size())
            return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
};

class StringWriter final : public IWriter {
  public:
    Result WriteAll(std::span<const std::uint8_t> in) override {
        data_.append(reinterpret_cast<const char*>(in.data()), in.size());
        return Result::Ok();
    }

    Result FsyncNow() override { return Result::Ok(); }

    const std::string& Data() const { return data_; }

  private:
    std::string data_;
};

} // namespace hubagent
