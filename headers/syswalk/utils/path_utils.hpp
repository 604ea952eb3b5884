//
// Created by gregorian-rayne on 10/3/26.
//

#ifndef SYSWALK_PATH_UTILS_HPP
#define SYSWALK_PATH_UTILS_HPP

/**
 * @file path_utils.hpp
 * @brief Path normalization and containment helpers.
 */

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

namespace syswalk::path_utils {

    namespace fs = std::filesystem;

    /**
     * Resolves . and .. lexically. Works on paths that don't exist and
     * doesn't follow symlinks.
     */
    inline fs::path normalize(const fs::path& path) {
        fs::path result;

        for (const auto& component : path) {
            if (component == ".") {
                continue;
            }
            if (component == "..") {
                if (!result.empty() && result == result.root_path()) {
                    continue;
                }
                if (!result.empty() && result.filename() != "..") {
                    result = result.parent_path();
                } else {
                    result /= component;
                }
            } else if (!component.empty()) {
                result /= component;
            }
        }

        return result.empty() ? "." : result;
    }

    /**
     * Canonical absolute form used as file identity. Symlinks are followed
     * for the existing prefix; the remainder is normalized lexically.
     */
    inline fs::path canonical_path(const fs::path& path) {
        std::error_code ec;
        auto absolute = fs::absolute(path, ec);
        if (ec) {
            absolute = path;
        }
        auto result = fs::weakly_canonical(absolute, ec);
        if (ec) {
            return normalize(absolute);
        }
        return result;
    }

    /**
     * Component-wise check that path equals base or lies below it.
     * "/a/bc" is not under "/a/b".
     */
    inline bool is_under(const fs::path& path, const fs::path& base) {
        std::vector<fs::path> path_parts;
        std::vector<fs::path> base_parts;
        for (const auto& component : path) {
            if (!component.empty()) path_parts.push_back(component);
        }
        for (const auto& component : base) {
            if (!component.empty()) base_parts.push_back(component);
        }

        if (base_parts.size() > path_parts.size()) {
            return false;
        }
        return std::equal(base_parts.begin(), base_parts.end(), path_parts.begin());
    }

    /**
     * Relative path of target from base in generic (forward slash) form,
     * e.g. "web/app.js". Falls back to the full generic path.
     */
    inline std::string relative_generic(const fs::path& target, const fs::path& base) {
        const auto rel = target.lexically_relative(base);
        if (rel.empty()) {
            return target.generic_string();
        }
        return rel.generic_string();
    }

    /**
     * Splits a generic relative path into its segments.
     */
    inline std::vector<std::string> segments(const std::string& generic_path) {
        std::vector<std::string> parts;
        for (const auto& component : fs::path(generic_path)) {
            if (auto str = component.generic_string(); !str.empty() && str != "/") {
                parts.push_back(std::move(str));
            }
        }
        return parts;
    }

}  // namespace syswalk::path_utils

#endif //SYSWALK_PATH_UTILS_HPP
