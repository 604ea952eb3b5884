//
// Created by gregorian-rayne on 10/10/26.
//

#include "syswalk/utils/string_utils.hpp"

#include <gtest/gtest.h>

namespace syswalk::string_utils
{
    TEST(StringUtilsTest, Trim) {
        EXPECT_EQ(trim("  ./app.js \n"), "./app.js");
        EXPECT_EQ(trim_left("\t x "), "x ");
        EXPECT_EQ(trim_right(" x \t"), " x");
        EXPECT_EQ(trim("   "), "");
        EXPECT_EQ(trim(""), "");
    }

    TEST(StringUtilsTest, Split) {
        const auto parts = split("a,,b", ',');

        ASSERT_EQ(parts.size(), 3u);
        EXPECT_EQ(parts[0], "a");
        EXPECT_EQ(parts[1], "");
        EXPECT_EQ(parts[2], "b");
    }

    TEST(StringUtilsTest, SplitListDropsBlanks) {
        const auto items = split_list(" .js, .HTML ,, ");

        ASSERT_EQ(items.size(), 2u);
        EXPECT_EQ(items[0], ".js");
        EXPECT_EQ(items[1], ".HTML");
        EXPECT_TRUE(split_list("").empty());
    }

    TEST(StringUtilsTest, StartsEndsContains) {
        EXPECT_TRUE(starts_with("../lib", "../"));
        EXPECT_FALSE(starts_with(".", "./"));
        EXPECT_TRUE(ends_with("index.html", ".html"));
        EXPECT_FALSE(ends_with("html", ".html"));
        EXPECT_TRUE(contains("a/b/c", "/b/"));
    }

    TEST(StringUtilsTest, ToLower) {
        EXPECT_EQ(to_lower("Web/INDEX.Html"), "web/index.html");
    }

    TEST(StringUtilsTest, LessCaseInsensitive) {
        EXPECT_TRUE(less_case_insensitive("alpha", "Beta"));
        EXPECT_FALSE(less_case_insensitive("Beta", "alpha"));
        EXPECT_TRUE(less_case_insensitive("Readme", "readme"));
        EXPECT_FALSE(less_case_insensitive("same", "same"));
    }

    TEST(StringUtilsTest, ReplaceAll) {
        EXPECT_EQ(replace_all("pkg.sub.mod", ".", "/"), "pkg/sub/mod");
        EXPECT_EQ(replace_all("abc", "", "x"), "abc");
        EXPECT_EQ(replace_all("aaa", "aa", "b"), "ba");
    }

    TEST(StringUtilsTest, Utf8Validation) {
        EXPECT_TRUE(is_valid_utf8("plain ascii"));
        EXPECT_TRUE(is_valid_utf8("caf\xc3\xa9"));
        EXPECT_TRUE(is_valid_utf8("\xf0\x9f\x98\x80"));
        EXPECT_FALSE(is_valid_utf8("\xc3"));
        EXPECT_FALSE(is_valid_utf8("\xff\xfe"));
        EXPECT_FALSE(is_valid_utf8("\xc0\xaf"));
        EXPECT_FALSE(is_valid_utf8("\xed\xa0\x80"));
    }
}  // namespace syswalk::string_utils
