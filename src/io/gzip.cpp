#include "hubagent/io/gzip.hpp"

#include "hubagent/io/gzip_reader.hpp"
#include "hubagent/io/memory_io.hpp"

#include <array>
#include <exception>
#include <memory>
#include <zlib.h>

namespace hubagent {

namespace {

class DeflateStream {
public:
    DeflateStream() = default;
    DeflateStream(const DeflateStream&) = delete;
    DeflateStream& operator=(const DeflateStream&) = delete;
    ~DeflateStream() {
        if (initialized_) deflateEnd(&strm_);
    }

    int Init() {
        // 16 + MAX_WBITS selects the gzip wrapper instead of raw zlib.
        const int ret = deflateInit2(&strm_, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                                     16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
        initialized_ = (ret == Z_OK);
        return ret;
    }

    z_stream& get() { return strm_; }

private:
    z_stream strm_{};
    bool initialized_ = false;
};

} // namespace

std::expected<std::vector<std::uint8_t>, std::string> CompressGzip(std::span<const std::uint8_t> data) {
    DeflateStream stream;
    if (const int ret = stream.Init(); ret != Z_OK) {
        return std::unexpected("gzip: deflateInit2 failed (" + std::to_string(ret) + ")");
    }

    z_stream& strm = stream.get();
    std::vector<std::uint8_t> out(deflateBound(&strm, static_cast<uLong>(data.size())));

    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    while (true) {
        const int ret = deflate(&strm, Z_FINISH);
        if (ret == Z_STREAM_END) break;
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            return std::unexpected("gzip: deflate failed (" + std::to_string(ret) + ")");
        }
        if (strm.avail_out == 0) {
            const size_t used = out.size();
            out.resize(used * 2);
            strm.next_out = out.data() + used;
            strm.avail_out = static_cast<uInt>(out.size() - used);
        }
    }

    out.resize(strm.total_out);
    return out;
}

std::expected<std::vector<std::uint8_t>, std::string> DecompressGzip(std::span<const std::uint8_t> data) {
    std::unique_ptr<GzipReader> reader;
    try {
        reader = std::make_unique<GzipReader>(
            std::make_unique<MemoryReader>(std::vector<std::uint8_t>(data.begin(), data.end())));
    } catch (const std::exception& e) {
        return std::unexpected(std::string("gzip: ") + e.what());
    }

    std::vector<std::uint8_t> out;
    std::array<std::uint8_t, 16384> buf{};
    while (true) {
        const ssize_t n = reader->Read(buf);
        if (n < 0) return std::unexpected("gzip: invalid compressed data");
        if (n == 0) break;
        out.insert(out.end(), buf.begin(), buf.begin() + n);
    }
    if (!reader->Finished()) {
        return std::unexpected("gzip: unexpected end of compressed data");
    }
    return out;
}

} // namespace hubagent
