#include "hubagent/update/temp_file.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <string>
#include <unistd.h>

namespace hubagent {
namespace {

TEST(TempFileTest, CreatedBesideDestinationWithOwnerOnlyMode) {
    testutil::TemporaryDirectory tmp;
    const std::string dst = tmp.Path() + "/hub-agent";

    TempFile file;
    auto res = TempFile::CreateFor(dst, file);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_EQ(file.Path().rfind(tmp.Path() + "/.hub-agent.", 0), 0u);
    EXPECT_EQ(testutil::FileMode(file.Path()), 0600u);
    EXPECT_GE(file.GetFd(), 0);
}

TEST(TempFileTest, RemovedOnDestruction) {
    testutil::TemporaryDirectory tmp;
    std::string path;
    {
        TempFile file;
        ASSERT_TRUE(TempFile::CreateFor(tmp.Path() + "/bin", file).is_ok());
        path = file.Path();
        ASSERT_EQ(::access(path.c_str(), F_OK), 0);
    }
    EXPECT_NE(::access(path.c_str(), F_OK), 0);
    EXPECT_TRUE(testutil::ListDirectory(tmp.Path()).empty());
}

TEST(TempFileTest, ReleaseKeepsFile) {
    testutil::TemporaryDirectory tmp;
    std::string path;
    {
        TempFile file;
        ASSERT_TRUE(TempFile::CreateFor(tmp.Path() + "/bin", file).is_ok());
        path = file.Path();
        auto r = file.SyncAndClose();
        ASSERT_TRUE(r.is_ok()) << r.msg;
        file.Release();
    }
    EXPECT_EQ(::access(path.c_str(), F_OK), 0);
}

TEST(TempFileTest, MissingDirectoryFails) {
    testutil::TemporaryDirectory tmp;
    TempFile file;
    auto res = TempFile::CreateFor(tmp.Path() + "/no_such_dir/bin", file);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.err, ENOENT);
}

TEST(TempFileTest, SecondSyncAndCloseFails) {
    testutil::TemporaryDirectory tmp;
    TempFile file;
    ASSERT_TRUE(TempFile::CreateFor(tmp.Path() + "/bin", file).is_ok());
    ASSERT_TRUE(file.SyncAndClose().is_ok());
    EXPECT_FALSE(file.SyncAndClose().is_ok());
}

} // namespace
} // namespace hubagent
