//
// Created by gregorian-rayne on 10/11/26.
//

#include "syswalk/extractors/markup_extractor.hpp"

#include <gtest/gtest.h>

namespace syswalk::extractors
{
    namespace {

    std::vector<std::string> reference_texts(const std::string_view html) {
        const MarkupExtractor extractor;
        auto result = extractor.extract(html, "/proj/web/index.html");
        EXPECT_TRUE(result.is_ok());
        std::vector<std::string> out;
        for (const auto& ref : result.value().references) {
            out.push_back(ref.text);
        }
        return out;
    }

    }  // namespace

    TEST(HtmlTagScannerTest, ReadsTagsAndAttributes) {
        HtmlTagScanner scanner(R"(<link rel=stylesheet HREF="./a.css" disabled><img src='b.png'>)");

        auto link = scanner.next();
        ASSERT_TRUE(link.has_value());
        EXPECT_EQ(link->name, "link");
        EXPECT_EQ(link->attribute("rel").value(), "stylesheet");
        EXPECT_EQ(link->attribute("href").value(), "./a.css");
        ASSERT_EQ(link->attributes.size(), 3u);
        EXPECT_FALSE(link->attributes[2].second.has_value());
        EXPECT_FALSE(link->attribute("src").has_value());

        auto img = scanner.next();
        ASSERT_TRUE(img.has_value());
        EXPECT_EQ(img->attribute("src").value(), "b.png");

        EXPECT_FALSE(scanner.next().has_value());
    }

    TEST(HtmlTagScannerTest, LastDuplicateAttributeWins) {
        HtmlTagScanner scanner(R"(<img src="./first.png" src="./second.png">)");

        const auto tag = scanner.next();
        ASSERT_TRUE(tag.has_value());
        EXPECT_EQ(tag->attribute("src").value(), "./second.png");
    }

    TEST(HtmlTagScannerTest, SkipsCommentsDeclarationsAndEndTags) {
        HtmlTagScanner scanner("<!DOCTYPE html><!-- <img src=\"./x.png\"> --></div>a < b<p>");

        const auto tag = scanner.next();
        ASSERT_TRUE(tag.has_value());
        EXPECT_EQ(tag->name, "p");
        EXPECT_FALSE(scanner.next().has_value());
    }

    TEST(HtmlTagScannerTest, UnterminatedTagEndsScan) {
        HtmlTagScanner scanner(R"(<p><img src="./a.png")");

        EXPECT_TRUE(scanner.next().has_value());
        EXPECT_FALSE(scanner.next().has_value());
    }

    TEST(HtmlEntityTest, Decode) {
        EXPECT_EQ(decode_html_entities("./a&amp;b.css"), "./a&b.css");
        EXPECT_EQ(decode_html_entities("&lt;&gt;&quot;&apos;"), "<>\"'");
        EXPECT_EQ(decode_html_entities("&#46;/x&#x2F;y"), "./x/y");
        EXPECT_EQ(decode_html_entities("&copy; &unknown;"), "&copy; &unknown;");
        EXPECT_EQ(decode_html_entities("a & b"), "a & b");
    }

    TEST(MarkupExtractorTest, CollectsReferenceAttributes) {
        const auto refs = reference_texts(R"(
<html>
<head>
  <link rel="stylesheet" href="./css/site.css">
  <script src="./app.js"></script>
</head>
<body>
  <img data-src='../shared/hero.png'>
  <video poster=/media/poster.jpg></video>
</body>
</html>
)");

        ASSERT_EQ(refs.size(), 4u);
        EXPECT_EQ(refs[0], "./css/site.css");
        EXPECT_EQ(refs[1], "./app.js");
        EXPECT_EQ(refs[2], "../shared/hero.png");
        EXPECT_EQ(refs[3], "/media/poster.jpg");
    }

    TEST(MarkupExtractorTest, SkipsNonRelativeTargets) {
        const auto refs = reference_texts(R"(
<a href="https://example.com/">x</a>
<a href="#top">top</a>
<a href="about.html">about</a>
<a href="mailto:me@example.com">mail</a>
<script src="//cdn.example.com/lib.js"></script>
)");

        ASSERT_EQ(refs.size(), 1u);
        EXPECT_EQ(refs[0], "//cdn.example.com/lib.js");
    }

    TEST(MarkupExtractorTest, IgnoresScriptBodiesAndComments) {
        const auto refs = reference_texts(R"(
<!-- <script src="./old.js"></script> -->
<script>
  const html = "<img src='./fake.png'>";
</script>
<style>body { background: url(./bg.png); }</style>
<SCRIPT SRC=" ./real.js "></SCRIPT>
)");

        ASSERT_EQ(refs.size(), 1u);
        EXPECT_EQ(refs[0], "./real.js");
    }

    TEST(MarkupExtractorTest, DecodesEntitiesInValues) {
        const auto refs = reference_texts(R"(<link href="./a&amp;b.css">)");

        ASSERT_EQ(refs.size(), 1u);
        EXPECT_EQ(refs[0], "./a&b.css");
    }
}  // namespace syswalk::extractors
