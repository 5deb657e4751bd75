#include "hubagent/io/fd_writer.hpp"
#include "hubagent/io/file_reader.hpp"
#include "testing.hpp"

#include <cstdint>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

class FileIoTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string MakePath(const std::string& name) { return tmp.Path() + "/" + name; }
};

TEST_F(FileIoTests, OpenOK_AndTotalSizeMatches) {
    const std::string p = MakePath("in.bin");
    std::string data(12345, '\0');
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<char>(i & 0xFF);
    testutil::WriteFile(p, data);

    hubagent::FileReader r;
    auto res = hubagent::FileReader::Open(p, r);
    ASSERT_TRUE(res.ok) << res.msg;

    auto sz = r.TotalSize();
    ASSERT_TRUE(sz.has_value());
    EXPECT_EQ(*sz, data.size());
}

TEST_F(FileIoTests, OpenNonexistent_Fails) {
    hubagent::FileReader r;
    auto res = hubagent::FileReader::Open(MakePath("nope.bin"), r);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.err, ENOENT);
}

TEST_F(FileIoTests, WriterThenReader_SameBytes) {
    const std::string p = MakePath("out.bin");
    std::vector<std::uint8_t> data(1024 * 1024 + 123);
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<std::uint8_t>((i ^ 0x5A) & 0xFF);

    hubagent::Fd fd(::open(p.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600));
    ASSERT_TRUE(fd.Valid());

    hubagent::FdWriter w(fd.Get());
    auto wr = w.WriteAll(data);
    ASSERT_TRUE(wr.ok) << wr.msg;
    auto fs = w.FsyncNow();
    ASSERT_TRUE(fs.ok) << fs.msg;
    EXPECT_EQ(w.BytesWritten(), data.size());
    ASSERT_EQ(fd.Close(), 0);

    hubagent::FileReader r;
    auto res = hubagent::FileReader::Open(p, r);
    ASSERT_TRUE(res.ok) << res.msg;

    std::vector<std::uint8_t> out(data.size());
    size_t pos = 0;
    while (pos < out.size()) {
        ssize_t n = r.Read(std::span<std::uint8_t>(out.data() + pos, out.size() - pos));
        ASSERT_GE(n, 0);
        if (n == 0)
            break;
        pos += static_cast<size_t>(n);
    }

    ASSERT_EQ(pos, data.size());
    EXPECT_EQ(out, data);
}

TEST_F(FileIoTests, WriterOnReadOnlyFd_Fails) {
    const std::string p = MakePath("ro.bin");
    testutil::WriteFile(p, "x");

    hubagent::Fd fd(::open(p.c_str(), O_RDONLY));
    ASSERT_TRUE(fd.Valid());

    hubagent::FdWriter w(fd.Get());
    const std::string payload = "data";
    auto wr = w.WriteAll(testutil::Bytes(payload));
    ASSERT_FALSE(wr.ok);
    EXPECT_EQ(wr.err, EBADF);
    EXPECT_EQ(w.BytesWritten(), 0u);
}

} // namespace
