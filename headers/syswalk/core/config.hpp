//
// Created by gregorian-rayne on 10/8/26.
//

#ifndef SYSWALK_CONFIG_HPP
#define SYSWALK_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Project configuration loaded from .syswalk.toml.
 *
 * Example:
 *
 *     [scan]
 *     dirs = ["web", "server"]
 *     extensions = [".js", ".html"]
 *     include_hidden = false
 *     threads = 1
 *
 *     [roots]
 *     entries = ["web/index.html"]
 *     fallback_limit = 10
 *
 *     [report]
 *     file = "system-walk-results.txt"   # default: .json for format = "json"
 *     format = "text"
 *
 * Every key is optional. Command-line options override file values.
 */

#include "syswalk/result.hpp"
#include "syswalk/error.hpp"
#include "syswalk/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace syswalk::core {

    inline constexpr std::string_view CONFIG_FILE_NAME = ".syswalk.toml";

    struct ScanConfig {
        std::vector<std::string> dirs;
        std::vector<std::string> extensions;
        bool include_hidden = false;
        std::int64_t threads = 1;
    };

    struct RootsConfig {
        std::vector<std::string> entries;
        std::int64_t fallback_limit = 10;
    };

    struct ReportConfig {
        /// Unset means the default name for the chosen format
        std::optional<std::string> file;
        std::string format = "text";
    };

    struct Config {
        ScanConfig scan;
        RootsConfig roots;
        ReportConfig report;

        /**
         * @return The configuration, or a ConfigError for a missing file,
         *         malformed TOML, wrongly typed keys or invalid values.
         */
        static Result<Config, Error> load_from_file(const fs::path& path);

        /**
         * @param source Name used in error messages.
         */
        static Result<Config, Error> load_from_string(std::string_view content,
                                                      std::string_view source = "<string>");

        static Config default_config();

        /**
         * Checks value ranges and the report format name.
         */
        [[nodiscard]] Result<void, Error> validate() const;

        /**
         * Walk options for @p root; relative scan directories stay
         * relative and are resolved by the walker.
         */
        [[nodiscard]] WalkOptions to_walk_options(const fs::path& root) const;
    };

    /**
     * Loads @p explicit_file if given (it must exist), otherwise
     * root/.syswalk.toml if present, otherwise the defaults.
     */
    [[nodiscard]] Result<Config, Error> load_project_config(
        const fs::path& root,
        const fs::path& explicit_file = {}
    );

}  // namespace syswalk::core

#endif //SYSWALK_CONFIG_HPP
