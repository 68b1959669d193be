#include "testing.hpp"
#include "userjs/header_parser.hpp"

#include <cerrno>
#include <gtest/gtest.h>
#include <sstream>
#include <string>

namespace userjs {
namespace {

TEST(HeaderParserTest, ExtractsSuffixesAfterMarkers) {
    const std::string text = testutil::MakeScript(
        "ghacks user.js", "14 February 2020", "73-beta: Soundboard Shuffle",
        "user_pref(\"a.b\", true);\n");

    HeaderParser parser;
    auto rec = parser.Parse(text);
    ASSERT_TRUE(rec.has_value()) << rec.error();
    EXPECT_EQ(rec->name, "ghacks user.js");
    EXPECT_EQ(rec->date, "14 February 2020");
    EXPECT_EQ(rec->version, "73-beta: Soundboard Shuffle");
    EXPECT_EQ(rec->ToString(), "ghacks user.js: 73-beta: Soundboard Shuffle from 14 February 2020");
}

TEST(HeaderParserTest, StripsCarriageReturns) {
    const std::string text =
        "/******\r\n* name: ghacks user.js\r\n* date: 1 May 2020\r\n* version 75\r\n";

    auto rec = HeaderParser().Parse(text);
    ASSERT_TRUE(rec.has_value()) << rec.error();
    EXPECT_EQ(rec->name, "ghacks user.js");
    EXPECT_EQ(rec->date, "1 May 2020");
    EXPECT_EQ(rec->version, "75");
}

TEST(HeaderParserTest, MarkerMayFollowArbitraryPrefix) {
    const std::string text = "/*\n  ** name: ghacks custom\n//date: today\nrelease version 1.0\n";

    auto rec = HeaderParser().Parse(text);
    ASSERT_TRUE(rec.has_value()) << rec.error();
    EXPECT_EQ(rec->name, "ghacks custom");
    EXPECT_EQ(rec->date, "today");
    EXPECT_EQ(rec->version, "1.0");
}

TEST(HeaderParserTest, ConsumesOnlyFourLinesFromStream) {
    std::istringstream in(testutil::MakeScript("ghacks user.js", "d", "v", "rest\n"));

    auto rec = HeaderParser().Parse(in);
    ASSERT_TRUE(rec.has_value()) << rec.error();

    std::string next;
    ASSERT_TRUE(std::getline(in, next));
    EXPECT_EQ(next, "******/");
}

TEST(HeaderParserTest, RejectsUnrecognizedFamily) {
    const std::string text = testutil::MakeScript("arkenfox user.js", "d", "v");

    auto rec = HeaderParser().Parse(text);
    ASSERT_FALSE(rec.has_value());
    EXPECT_EQ(rec.error(), "Version not recognized");
}

TEST(HeaderParserTest, FamilyTokenIsConfigurable) {
    const std::string text = testutil::MakeScript("arkenfox user.js", "d", "v");

    auto rec = HeaderParser("arkenfox").Parse(text);
    ASSERT_TRUE(rec.has_value()) << rec.error();
    EXPECT_EQ(rec->name, "arkenfox user.js");
}

TEST(HeaderParserTest, MissingLinesOrMarkersFail) {
    struct FailCase {
        std::string text;
        std::string expected_error_substr;
    };
    const FailCase cases[] = {
        {"", "empty input"},
        {"/******\n", "missing line 2"},
        {"/******\n* name: ghacks user.js\n", "missing line 3"},
        {"/******\n* name: ghacks user.js\n* date: d\n", "missing line 4"},
        {"/******\n* title: ghacks user.js\n* date: d\n* version v\n", "line 2"},
        {"/******\n* name: ghacks user.js\n* when: d\n* version v\n", "line 3"},
        {"/******\n* name: ghacks user.js\n* date: d\n* release: v\n", "line 4"},
    };
    for (const auto& c : cases) {
        auto rec = HeaderParser().Parse(c.text);
        ASSERT_FALSE(rec.has_value()) << c.text;
        EXPECT_NE(rec.error().find(c.expected_error_substr), std::string::npos) << rec.error();
    }
}

TEST(HeaderParserTest, RecordsCompareAllFields) {
    const VersionRecord a{.name = "ghacks user.js", .version = "73", .date = "d"};
    VersionRecord b = a;
    EXPECT_EQ(a, b);

    b.date = "other";
    EXPECT_NE(a, b);
    b = a;
    b.version = "74";
    EXPECT_NE(a, b);
}

class HeaderParserFileTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
};

TEST_F(HeaderParserFileTest, MissingFileIsReportedAsNotFound) {
    VersionRecord rec;
    auto res = HeaderParser().ParseFile(tmp.File("user.js"), rec);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::Io);
    EXPECT_EQ(res.err, ENOENT);
}

TEST_F(HeaderParserFileTest, MalformedFileIsParseError) {
    testutil::WriteFile(tmp.File("user.js"), "// just a comment\n");

    VersionRecord rec;
    auto res = HeaderParser().ParseFile(tmp.File("user.js"), rec);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::Parse);
    EXPECT_TRUE(rec.name.empty());
}

TEST_F(HeaderParserFileTest, ParsesFileOnDisk) {
    testutil::WriteFile(tmp.File("user.js"),
                        testutil::MakeScript("ghacks user.js", "14 February 2020", "73"));

    VersionRecord rec;
    auto res = HeaderParser().ParseFile(tmp.File("user.js"), rec);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(rec.version, "73");
}

} // namespace
} // namespace userjs
