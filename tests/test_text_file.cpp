#include "testing.hpp"
#include "userjs/text_file.hpp"

#include <cerrno>
#include <gtest/gtest.h>
#include <string>

namespace {

class TextFileTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
};

TEST_F(TextFileTests, ReadMissingFileIsNotFound) {
    std::string out = "stale";
    auto res = userjs::ReadTextFile(tmp.File("absent.js"), out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, userjs::ErrorKind::Io);
    EXPECT_EQ(res.err, ENOENT);
    EXPECT_TRUE(userjs::IsNotFound(res));
    EXPECT_TRUE(out.empty());
}

TEST_F(TextFileTests, DurableWriteThenReadBack) {
    const std::string path = tmp.File("user.js.new");
    const std::string payload = "user_pref(\"a\", 1);\r\nline two\n";

    auto wr = userjs::WriteTextFileDurable(path, payload);
    ASSERT_TRUE(wr.is_ok()) << wr.msg;
    EXPECT_TRUE(userjs::FileExists(path));

    std::string back;
    auto rr = userjs::ReadTextFile(path, back);
    ASSERT_TRUE(rr.is_ok()) << rr.msg;
    EXPECT_EQ(back, payload);
}

TEST_F(TextFileTests, DurableWriteTruncatesExistingFile) {
    const std::string path = tmp.File("out.js");
    testutil::WriteFile(path, std::string(4096, 'x'));

    ASSERT_TRUE(userjs::WriteTextFileDurable(path, "short").is_ok());
    EXPECT_EQ(testutil::ReadFile(path), "short");
}

TEST_F(TextFileTests, WriteIntoMissingDirectoryFails) {
    auto res = userjs::WriteTextFileDurable(tmp.File("no/such/dir/file.js"), "x");
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, userjs::ErrorKind::Io);
    EXPECT_EQ(res.err, ENOENT);
}

TEST(IsNotFoundTest, OnlyIoErrnoCounts) {
    // httplib::Error::Connection and ENOENT share the value 2.
    EXPECT_FALSE(userjs::IsNotFound(
        userjs::Result::Fail(userjs::ErrorKind::Network, ENOENT, "connection failed")));
    EXPECT_FALSE(userjs::IsNotFound(
        userjs::Result::Fail(userjs::ErrorKind::Parse, ENOENT, "bad header")));
    EXPECT_FALSE(userjs::IsNotFound(userjs::Result::Ok()));
    EXPECT_TRUE(userjs::IsNotFound(
        userjs::Result::Fail(userjs::ErrorKind::Io, ENOENT, "cannot open user.js")));
}

TEST_F(TextFileTests, SameFilePathNormalizesSpelling) {
    const std::string live = tmp.File("user.js");
    testutil::WriteFile(live, "x");

    EXPECT_TRUE(userjs::SameFilePath(live, tmp.Path() + "/./user.js"));
    EXPECT_TRUE(userjs::SameFilePath(live, tmp.Path() + "/sub/../user.js"));
    EXPECT_TRUE(userjs::SameFilePath(tmp.File("absent.js"), tmp.Path() + "//absent.js"));
    EXPECT_TRUE(userjs::SameFilePath("user.js", "./user.js"));
    EXPECT_FALSE(userjs::SameFilePath(live, tmp.File("user.js.new")));
}

} // namespace
