//
// Created by gregorian-rayne on 10/5/26.
//

#ifndef SYSWALK_PATH_RESOLVER_HPP
#define SYSWALK_PATH_RESOLVER_HPP

/**
 * @file path_resolver.hpp
 * @brief Maps a raw reference string to the file it names.
 *
 * Resolution order for a reference written in file F:
 * 1. "#fragment" then "?query" suffixes are dropped.
 * 2. "/x" is taken relative to the project root, anything else relative
 *    to the directory of F.
 * 3. The candidate itself, if it is a regular file.
 * 4. candidate + ext for ext in COMMON_EXTENSIONS, in order.
 * 5. If the candidate is a directory, candidate/index + ext for ext in
 *    INDEX_EXTENSIONS, in order.
 *
 * The first hit wins, so "./util" picks util.js over util/index.js.
 * A reference that matches nothing is not an error.
 */

#include "syswalk/types.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace syswalk::resolver {

    inline constexpr std::array<std::string_view, 13> COMMON_EXTENSIONS = {
        "", ".js", ".jsx", ".ts", ".tsx", ".mjs", ".cjs",
        ".css", ".scss", ".less", ".html", ".htm", ".py"
    };

    inline constexpr std::array<std::string_view, 9> INDEX_EXTENSIONS = {
        ".js", ".ts", ".tsx", ".jsx", ".mjs", ".cjs", ".html", ".htm", ".py"
    };

    /**
     * Drops everything from the first '#', then everything from the
     * first '?'.
     */
    [[nodiscard]] std::string_view strip_query_and_fragment(std::string_view reference) noexcept;

    /**
     * Resolves one spelling of a reference.
     *
     * @param text Raw reference, e.g. "./util" or "/css/site.css?v=2".
     * @param origin File the reference was found in.
     * @param root Project root used for "/"-prefixed references.
     * @return Canonical absolute path of an existing regular file, or
     *         std::nullopt.
     */
    [[nodiscard]] std::optional<fs::path> resolve_reference(
        std::string_view text,
        const fs::path& origin,
        const fs::path& root
    );

    /**
     * Tries the reference text, then each alternative spelling, and
     * returns the first that resolves.
     */
    [[nodiscard]] std::optional<fs::path> resolve(const Reference& reference, const fs::path& root);

}  // namespace syswalk::resolver

#endif //SYSWALK_PATH_RESOLVER_HPP
