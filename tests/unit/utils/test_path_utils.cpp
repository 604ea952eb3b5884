//
// Created by gregorian-rayne on 10/10/26.
//

#include "syswalk/utils/path_utils.hpp"
#include "support/temp_tree.hpp"

#include <gtest/gtest.h>

namespace syswalk::path_utils
{
    TEST(PathUtilsTest, Normalize) {
        EXPECT_EQ(normalize("/proj/web/./lib/../app.js"), fs::path("/proj/web/app.js"));
        EXPECT_EQ(normalize("a/b/../../.."), fs::path(".."));
        EXPECT_EQ(normalize("/../x"), fs::path("/x"));
        EXPECT_EQ(normalize("./"), fs::path("."));
    }

    TEST(PathUtilsTest, CanonicalPathOfMissingFile) {
        const test::TempTree tree;
        tree.mkdir("web");

        const auto result = canonical_path(tree.path("web/../server/missing.js"));

        EXPECT_EQ(result, tree.root() / "server" / "missing.js");
    }

    TEST(PathUtilsTest, IsUnder) {
        EXPECT_TRUE(is_under("/proj/web/app.js", "/proj"));
        EXPECT_TRUE(is_under("/proj/web", "/proj/web"));
        EXPECT_FALSE(is_under("/proj/website/app.js", "/proj/web"));
        EXPECT_FALSE(is_under("/proj", "/proj/web"));
    }

    TEST(PathUtilsTest, RelativeGeneric) {
        EXPECT_EQ(relative_generic("/proj/web/app.js", "/proj"), "web/app.js");
        EXPECT_EQ(relative_generic("/proj", "/proj"), ".");
    }

    TEST(PathUtilsTest, Segments) {
        const auto parts = segments("web/lib/util.js");

        ASSERT_EQ(parts.size(), 3u);
        EXPECT_EQ(parts[0], "web");
        EXPECT_EQ(parts[2], "util.js");
        EXPECT_TRUE(segments("").empty());
    }
}  // namespace syswalk::path_utils
