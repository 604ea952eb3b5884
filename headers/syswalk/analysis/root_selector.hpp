//
// Created by gregorian-rayne on 10/6/26.
//

#ifndef SYSWALK_ROOT_SELECTOR_HPP
#define SYSWALK_ROOT_SELECTOR_HPP

/**
 * @file root_selector.hpp
 * @brief Entry-point selection for reachability.
 *
 * Three tiers, the first non-empty one wins:
 * 1. Explicit entries supplied by the caller (missing files are dropped).
 * 2. Conventional entry-point names probed under the root, then
 *    index.html / index.htm inside each scan directory.
 * 3. The first N markup files of the discovered set. This is a guess and
 *    may both miss real entry points and promote dead pages to roots.
 */

#include "syswalk/types.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace syswalk::analysis {

    inline constexpr std::array<std::string_view, 14> CONVENTIONAL_ROOTS = {
        "index.html", "public/index.html", "web/index.html", "frontend/index.html",
        "server.js", "api/server.js", "app.js", "main.js",
        "main.tsx", "src/main.tsx", "src/index.tsx",
        "app.py", "wsgi.py", "run.py"
    };

    inline constexpr std::array<std::string_view, 2> SCAN_DIR_INDEX_NAMES = {
        "index.html", "index.htm"
    };

    struct RootSelection {
        std::vector<fs::path> roots;
        RootSource source = RootSource::None;

        /// Explicit entries that did not name an existing file
        std::vector<std::string> dropped;
    };

    /**
     * Existing explicit entries, canonicalised, duplicates removed.
     * Relative entries are taken relative to @p root.
     */
    [[nodiscard]] std::vector<fs::path> existing_explicit_roots(
        const fs::path& root,
        const std::vector<std::string>& entries,
        std::vector<std::string>* dropped = nullptr
    );

    /**
     * Conventional entry points that exist, in probe order.
     */
    [[nodiscard]] std::vector<fs::path> convention_roots(
        const fs::path& root,
        const std::vector<fs::path>& scan_dirs
    );

    /**
     * First @p limit .html / .htm files of @p files in sorted order.
     */
    [[nodiscard]] std::vector<fs::path> fallback_roots(const FileSet& files, std::size_t limit);

    /**
     * Runs the three tiers in order.
     */
    [[nodiscard]] RootSelection select_roots(
        const fs::path& root,
        const std::vector<fs::path>& scan_dirs,
        const FileSet& files,
        const std::vector<std::string>& explicit_entries,
        std::size_t fallback_limit
    );

}  // namespace syswalk::analysis

#endif //SYSWALK_ROOT_SELECTOR_HPP
