//
// Created by gregorian-rayne on 10/10/26.
//

#include <gtest/gtest.h>
#include "syswalk/core/config.hpp"
#include "support/temp_tree.hpp"

using namespace syswalk;
using namespace syswalk::core;

class ConfigTest : public ::testing::Test {
protected:
    test::TempTree tree;
};

TEST_F(ConfigTest, DefaultConfig) {
    const auto config = Config::default_config();

    EXPECT_TRUE(config.scan.dirs.empty());
    EXPECT_TRUE(config.scan.extensions.empty());
    EXPECT_FALSE(config.scan.include_hidden);
    EXPECT_EQ(config.scan.threads, 1);
    EXPECT_TRUE(config.roots.entries.empty());
    EXPECT_EQ(config.roots.fallback_limit, 10);
    EXPECT_FALSE(config.report.file.has_value());
    EXPECT_EQ(config.report.format, "text");
    EXPECT_TRUE(config.validate().is_ok());
}

TEST_F(ConfigTest, LoadFromString) {
    const auto result = Config::load_from_string(R"(
[scan]
dirs = ["web", "server"]
extensions = [".js", ".html"]
include_hidden = true
threads = 4

[roots]
entries = ["web/index.html"]
fallback_limit = 3

[report]
file = "walk.txt"
format = "json"
)");

    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    const auto& config = result.value();

    ASSERT_EQ(config.scan.dirs.size(), 2u);
    EXPECT_EQ(config.scan.dirs[1], "server");
    EXPECT_EQ(config.scan.extensions.size(), 2u);
    EXPECT_TRUE(config.scan.include_hidden);
    EXPECT_EQ(config.scan.threads, 4);
    ASSERT_EQ(config.roots.entries.size(), 1u);
    EXPECT_EQ(config.roots.entries[0], "web/index.html");
    EXPECT_EQ(config.roots.fallback_limit, 3);
    EXPECT_EQ(config.report.file.value(), "walk.txt");
    EXPECT_EQ(config.report.format, "json");
}

TEST_F(ConfigTest, PartialConfigKeepsDefaults) {
    const auto result = Config::load_from_string("[roots]\nentries = [\"main.py\"]\n");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().roots.entries.size(), 1u);
    EXPECT_EQ(result.value().roots.fallback_limit, 10);
    EXPECT_EQ(result.value().report.format, "text");
}

TEST_F(ConfigTest, EmptyStringIsDefault) {
    const auto result = Config::load_from_string("");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().scan.threads, 1);
}

TEST_F(ConfigTest, MalformedToml) {
    const auto result = Config::load_from_string("[scan\ndirs = [", "broken.toml");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    EXPECT_EQ(result.error().context().value(), "broken.toml");
}

TEST_F(ConfigTest, WrongValueType) {
    const auto result = Config::load_from_string("[scan]\ndirs = \"web\"\n");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().message(), "'scan.dirs' must be an array of strings");
}

TEST_F(ConfigTest, WrongElementType) {
    const auto result = Config::load_from_string("[roots]\nentries = [\"a.html\", 3]\n");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().message(), "'roots.entries' must be an array of strings");
}

TEST_F(ConfigTest, SectionMustBeTable) {
    const auto result = Config::load_from_string("scan = 5\n");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().message(), "'scan' must be a table");
}

TEST_F(ConfigTest, ValidationRejectsNegativeThreads) {
    const auto result = Config::load_from_string("[scan]\nthreads = -1\n");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    EXPECT_EQ(result.error().message(), "scan.threads must not be negative");
}

TEST_F(ConfigTest, ValidationRejectsUnknownFormat) {
    auto config = Config::default_config();
    config.report.format = "xml";

    EXPECT_TRUE(config.validate().is_err());

    config.report.format = "JSON";
    EXPECT_TRUE(config.validate().is_ok());

    config.report.file = "";
    EXPECT_TRUE(config.validate().is_err());
}

TEST_F(ConfigTest, ToWalkOptions) {
    auto config = Config::default_config();
    config.scan.dirs = {"web"};
    config.scan.extensions = {".js"};
    config.roots.entries = {"web/index.html"};
    config.roots.fallback_limit = 2;
    config.scan.threads = 0;

    const auto options = config.to_walk_options("/proj");

    EXPECT_EQ(options.root, fs::path("/proj"));
    ASSERT_EQ(options.scan_dirs.size(), 1u);
    EXPECT_EQ(options.scan_dirs[0], fs::path("web"));
    EXPECT_TRUE(options.extensions.contains(".js"));
    EXPECT_EQ(options.explicit_roots.size(), 1u);
    EXPECT_EQ(options.fallback_root_limit, 2u);
    EXPECT_EQ(options.max_threads, 0u);
}

TEST_F(ConfigTest, LoadFromFile) {
    const auto file = tree.write("custom.toml", "[report]\nfile = \"out.txt\"\n");

    const auto result = Config::load_from_file(file);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().report.file.value(), "out.txt");
}

TEST_F(ConfigTest, LoadFromMissingFile) {
    const auto result = Config::load_from_file(tree.path("nope.toml"));

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
}

TEST_F(ConfigTest, ProjectConfigDiscovery) {
    auto absent = load_project_config(tree.root());
    ASSERT_TRUE(absent.is_ok());
    EXPECT_EQ(absent.value().report.format, "text");

    tree.write(".syswalk.toml", "[report]\nformat = \"json\"\n");
    auto present = load_project_config(tree.root());
    ASSERT_TRUE(present.is_ok());
    EXPECT_EQ(present.value().report.format, "json");

    const auto other = tree.write("alt/other.toml", "[scan]\nthreads = 2\n");
    auto explicit_file = load_project_config(tree.root(), other);
    ASSERT_TRUE(explicit_file.is_ok());
    EXPECT_EQ(explicit_file.value().scan.threads, 2);
    EXPECT_EQ(explicit_file.value().report.format, "text");
}
