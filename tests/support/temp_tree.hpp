//
// Created by gregorian-rayne on 10/10/26.
//

#ifndef SYSWALK_TESTS_TEMP_TREE_HPP
#define SYSWALK_TESTS_TEMP_TREE_HPP

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace syswalk::test
{
    namespace fs = std::filesystem;

    /**
     * Scratch directory under the system temp dir, named after the running
     * test and removed on destruction. The root is canonical so paths
     * compare equal to the ones the library produces.
     */
    class TempTree {
    public:
        TempTree() {
            const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
            std::string name = "syswalk_test";
            if (info) {
                name += "_";
                name += info->test_suite_name();
                name += "_";
                name += info->name();
            }

            root_ = fs::temp_directory_path() / name;
            std::error_code ec;
            fs::remove_all(root_, ec);
            fs::create_directories(root_);
            root_ = fs::canonical(root_);
        }

        ~TempTree() {
            std::error_code ec;
            fs::remove_all(root_, ec);
        }

        TempTree(const TempTree&) = delete;
        TempTree& operator=(const TempTree&) = delete;

        [[nodiscard]] const fs::path& root() const { return root_; }

        [[nodiscard]] fs::path path(const std::string& relative) const {
            return root_ / fs::path(relative);
        }

        fs::path write(const std::string& relative, const std::string& content = "") const {
            const auto target = path(relative);
            fs::create_directories(target.parent_path());
            std::ofstream file(target, std::ios::binary);
            file << content;
            return target;
        }

        fs::path mkdir(const std::string& relative) const {
            const auto target = path(relative);
            fs::create_directories(target);
            return target;
        }

        [[nodiscard]] std::string read(const std::string& relative) const {
            std::ifstream file(path(relative), std::ios::binary);
            return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
        }

    private:
        fs::path root_;
    };

}  // namespace syswalk::test

#endif //SYSWALK_TESTS_TEMP_TREE_HPP
