//
// Created by gregorian-rayne on 10/12/26.
//

#include "syswalk/analysis/classifier.hpp"

#include <gtest/gtest.h>

namespace syswalk::analysis
{
    class ClassifierTest : public ::testing::Test {
    protected:
        void SetUp() override {
            files = {
                "/p/web/index.html", "/p/web/app.js", "/p/web/util.js", "/p/web/orphan.css",
                "/p/web/old/a.js", "/p/web/old/deep/b.js",
                "/p/web/lib/x.js", "/p/web/lib/y.js",
            };
            reachable = {
                "/p/web/index.html", "/p/web/app.js", "/p/web/util.js", "/p/web/lib/x.js",
            };
        }

        FileSet files;
        FileSet reachable;
        const fs::path root = "/p";
        const std::vector<fs::path> scan_dirs = {"/p/web"};
    };

    TEST_F(ClassifierTest, Unreachable) {
        const auto result = classify(files, reachable, scan_dirs, root);

        EXPECT_EQ(result.unreachable, (FileSet{
            "/p/web/orphan.css", "/p/web/old/a.js", "/p/web/old/deep/b.js", "/p/web/lib/y.js"}));
    }

    TEST_F(ClassifierTest, UnnecessaryDirsIncludeNestedOnes) {
        const auto result = classify(files, reachable, scan_dirs, root);

        ASSERT_EQ(result.unnecessary_dirs.size(), 2u);
        EXPECT_EQ(result.unnecessary_dirs[0], fs::path("/p/web/old"));
        EXPECT_EQ(result.unnecessary_dirs[1], fs::path("/p/web/old/deep"));
    }

    TEST_F(ClassifierTest, KeepDirsAreMixed) {
        const auto result = classify(files, reachable, scan_dirs, root);

        ASSERT_EQ(result.keep_dirs.size(), 2u);
        EXPECT_EQ(result.keep_dirs[0], fs::path("/p/web"));
        EXPECT_EQ(result.keep_dirs[1], fs::path("/p/web/lib"));
    }

    TEST_F(ClassifierTest, OtherUnusedSkipsFilesInUnnecessaryDirs) {
        const auto result = classify(files, reachable, scan_dirs, root);

        ASSERT_EQ(result.other_unused_files.size(), 2u);
        EXPECT_EQ(result.other_unused_files[0], fs::path("/p/web/lib/y.js"));
        EXPECT_EQ(result.other_unused_files[1], fs::path("/p/web/orphan.css"));
    }

    TEST_F(ClassifierTest, DirectoriesAboveScanScopeAreIgnored) {
        const auto result = classify(files, reachable, scan_dirs, root);

        for (const auto& dir : result.keep_dirs) {
            EXPECT_NE(dir, fs::path("/p"));
        }
        for (const auto& dir : result.unnecessary_dirs) {
            EXPECT_NE(dir, fs::path("/p"));
        }
    }

    TEST_F(ClassifierTest, AllUsedDirectoryIsNeitherKeepNorUnnecessary) {
        const FileSet used_only = {"/p/web/a.js", "/p/web/b.js"};

        const auto result = classify(used_only, used_only, scan_dirs, root);

        EXPECT_TRUE(result.unreachable.empty());
        EXPECT_TRUE(result.unnecessary_dirs.empty());
        EXPECT_TRUE(result.keep_dirs.empty());
        EXPECT_TRUE(result.other_unused_files.empty());
    }

    TEST_F(ClassifierTest, ReachableTargetsOutsideFilesDoNotCount) {
        FileSet extra_reachable = reachable;
        extra_reachable.insert("/p/web/old/not-collected.js");

        const auto result = classify(files, extra_reachable, scan_dirs, root);

        ASSERT_EQ(result.unnecessary_dirs.size(), 2u);
    }

    TEST(SortByRelativePathTest, CaseInsensitiveOrder) {
        std::vector<fs::path> paths = {"/p/web/Zeta.js", "/p/web/alpha.js", "/p/Web2/b.js", "/p/web/Beta.js"};

        sort_by_relative_path(paths, "/p");

        ASSERT_EQ(paths.size(), 4u);
        EXPECT_EQ(paths[0], fs::path("/p/web/alpha.js"));
        EXPECT_EQ(paths[1], fs::path("/p/web/Beta.js"));
        EXPECT_EQ(paths[2], fs::path("/p/web/Zeta.js"));
        EXPECT_EQ(paths[3], fs::path("/p/Web2/b.js"));
    }
}  // namespace syswalk::analysis
