#include "../test_config.h"

#include "sandfs/core/utils.hpp"

namespace sandfs::Test {

TEST(UtilsTest, Trim)
{
    EXPECT_EQ(trim("  hello \r\n"), "hello");
    EXPECT_EQ(trim(" \t "), "");
    EXPECT_EQ(ltrim("  x "), "x ");
    EXPECT_EQ(rtrim("  x "), "  x");
}

TEST(UtilsTest, SplitAndJoin)
{
    std::vector<std::string> parts = split("a,b,,c", ',');
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[2], "");
    EXPECT_EQ(join(parts, "+"), "a+b++c");
    EXPECT_EQ(join(std::vector<std::string>(), "+"), "");
}

TEST(UtilsTest, PathComponents)
{
    std::vector<std::string> parts = path_components("//a/./b//c/");
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], ".");
    EXPECT_EQ(parts[3], "c");
    EXPECT_TRUE(path_components("/").empty());
    EXPECT_TRUE(path_components("").empty());
}

TEST(UtilsTest, JoinPath)
{
    EXPECT_EQ(join_path("/root", "a"), "/root/a");
    EXPECT_EQ(join_path("/root/", "/a"), "/root/a");
    EXPECT_EQ(join_path("/", "a"), "/a");
    EXPECT_EQ(join_path("", "a"), "a");
    EXPECT_EQ(join_path("/root", ""), "/root");
}

TEST(UtilsTest, OctalMode)
{
    unsigned int mode = 0;
    ASSERT_TRUE(parse_octal_mode("0700", mode));
    EXPECT_EQ(mode, 0700u);
    ASSERT_TRUE(parse_octal_mode(" 755 ", mode));
    EXPECT_EQ(mode, 0755u);

    mode = 1;
    EXPECT_FALSE(parse_octal_mode("0789", mode));
    EXPECT_FALSE(parse_octal_mode("", mode));
    EXPECT_FALSE(parse_octal_mode("07000", mode));
    EXPECT_EQ(mode, 1u);
}

TEST(UtilsTest, Utf8Validation)
{
    EXPECT_TRUE(is_valid_utf8(""));
    EXPECT_TRUE(is_valid_utf8("plain"));
    EXPECT_TRUE(is_valid_utf8("\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80"));

    size_t offset = 0;
    EXPECT_FALSE(is_valid_utf8("ab\xFF", &offset));
    EXPECT_EQ(offset, 2u);

    EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));          // overlong '/'
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));      // surrogate
    EXPECT_FALSE(is_valid_utf8("\xF4\x90\x80\x80"));  // above U+10FFFF
    EXPECT_FALSE(is_valid_utf8("\xE2\x82"));          // truncated
}

TEST(UtilsTest, TruncateSafe)
{
    EXPECT_EQ(truncate_safe("hello", 10), "hello");
    EXPECT_EQ(truncate_safe("hello", 3), "hel");
    // Never cuts a two-byte sequence in half
    EXPECT_EQ(truncate_safe("a\xC3\xA9", 2), "a");
}

} // namespace sandfs::Test
