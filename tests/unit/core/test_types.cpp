//
// Created by gregorian-rayne on 10/10/26.
//

#include "syswalk/types.hpp"

#include <gtest/gtest.h>

namespace syswalk
{
    TEST(TypesTest, FileFamilyByExtension) {
        EXPECT_EQ(file_family_for(".js"), FileFamily::Script);
        EXPECT_EQ(file_family_for(".tsx"), FileFamily::Script);
        EXPECT_EQ(file_family_for(".cjs"), FileFamily::Script);
        EXPECT_EQ(file_family_for(".py"), FileFamily::PythonModule);
        EXPECT_EQ(file_family_for(".htm"), FileFamily::Markup);
        EXPECT_EQ(file_family_for(".less"), FileFamily::Stylesheet);
        EXPECT_EQ(file_family_for(".json"), FileFamily::Other);
        EXPECT_EQ(file_family_for(""), FileFamily::Other);
    }

    TEST(TypesTest, CommentStyles) {
        const auto js = comment_style_for(".js");
        ASSERT_TRUE(js.has_value());
        EXPECT_EQ(js->prefix, "// ");
        EXPECT_EQ(js->suffix, "");

        const auto css = comment_style_for(".css");
        ASSERT_TRUE(css.has_value());
        EXPECT_EQ(css->prefix, "/* ");
        EXPECT_EQ(css->suffix, " */");

        EXPECT_EQ(comment_style_for(".md")->prefix, "<!-- ");
        EXPECT_EQ(comment_style_for(".ini")->prefix, "; ");
        EXPECT_EQ(comment_style_for(".sql")->prefix, "-- ");
        EXPECT_FALSE(comment_style_for(".json").has_value());
        EXPECT_FALSE(comment_style_for(".png").has_value());
    }

    TEST(TypesTest, KnownExtensionsIncludeJsonAndParsedFamilies) {
        const auto known = known_extensions();

        for (const auto* ext : {".js", ".jsx", ".ts", ".tsx", ".mjs", ".cjs", ".py",
                                ".html", ".htm", ".css", ".scss", ".less", ".json"}) {
            EXPECT_TRUE(known.contains(ext)) << ext;
        }
        EXPECT_FALSE(known.contains(".png"));
    }

    TEST(TypesTest, LowerExtension) {
        EXPECT_EQ(lower_extension("web/INDEX.HTML"), ".html");
        EXPECT_EQ(lower_extension("app.Js"), ".js");
        EXPECT_EQ(lower_extension("Makefile"), "");
        EXPECT_EQ(lower_extension("archive.tar.gz"), ".gz");
    }

    TEST(TypesTest, SourceFileFromPath) {
        const auto file = SourceFile::from_path("/proj/web/Site.CSS");

        EXPECT_EQ(file.path, fs::path("/proj/web/Site.CSS"));
        EXPECT_EQ(file.extension, ".css");
        EXPECT_EQ(file.family, FileFamily::Stylesheet);
        EXPECT_TRUE(file.commentable);

        const auto json = SourceFile::from_path("/proj/package.json");
        EXPECT_FALSE(json.commentable);
        EXPECT_EQ(json.family, FileFamily::Other);
    }

    TEST(TypesTest, SourceFileIdentityIsPath) {
        auto a = SourceFile::from_path("/proj/a.js");
        auto b = SourceFile::from_path("/proj/a.js");
        b.commentable = false;

        EXPECT_EQ(a, b);
        EXPECT_FALSE(a == SourceFile::from_path("/proj/b.js"));
    }

    TEST(TypesTest, EnumStrings) {
        EXPECT_STREQ(file_family_to_string(FileFamily::PythonModule), "python");
        EXPECT_STREQ(root_source_to_string(RootSource::Fallback), "fallback");
        EXPECT_STREQ(root_source_to_string(RootSource::None), "none");
        EXPECT_STREQ(diagnostic_kind_to_string(Diagnostic::Kind::NotText), "not-text");
        EXPECT_STREQ(diagnostic_kind_to_string(Diagnostic::Kind::ParserFallback), "parser-fallback");
    }

    TEST(TypesTest, WalkOptionsDefaults) {
        const WalkOptions options;

        EXPECT_TRUE(options.scan_dirs.empty());
        EXPECT_TRUE(options.extensions.empty());
        EXPECT_FALSE(options.include_hidden);
        EXPECT_EQ(options.fallback_root_limit, 10u);
        EXPECT_EQ(options.max_threads, 1u);
    }
}  // namespace syswalk
