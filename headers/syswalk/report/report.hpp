//
// Created by gregorian-rayne on 10/7/26.
//

#ifndef SYSWALK_REPORT_HPP
#define SYSWALK_REPORT_HPP

/**
 * @file report.hpp
 * @brief Rendering of walk results.
 *
 * The text report has four sections:
 * 1. Used files as an indented directory tree
 * 2. Unnecessary folders (every file unused)
 * 3. Keep folders (mixed)
 * 4. Other unused files
 *
 * All paths are shown relative to the project root with forward slashes.
 */

#include "syswalk/analysis/walker.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace syswalk::report {

    using json = nlohmann::json;

    inline constexpr std::string_view DEFAULT_RESULTS_FILE = "system-walk-results.txt";
    inline constexpr std::string_view DEFAULT_JSON_RESULTS_FILE = "system-walk-results.json";

    enum class ReportFormat {
        Text,
        Json
    };

    [[nodiscard]] const char* report_format_to_string(ReportFormat format) noexcept;

    /**
     * Accepts "text" and "json", case-insensitively.
     */
    [[nodiscard]] std::optional<ReportFormat> parse_report_format(std::string_view name);

    /**
     * Results file name used when neither --output nor report.file is set.
     */
    [[nodiscard]] std::string_view default_results_file(ReportFormat format) noexcept;

    /**
     * Where a text report goes. Only the title differs.
     */
    enum class Destination {
        File,
        Console
    };

    /**
     * Renders relative paths as a tree.
     *
     * Paths are sorted case-insensitively. Each path segment is printed
     * with two spaces of indentation per depth, and only when the path up
     * to and including it differs from the previous entry. An empty input
     * renders as "(none)".
     *
     * Example: {"web/index.html", "web/js/app.js"} gives
     *   web
     *     index.html
     *     js
     *       app.js
     */
    [[nodiscard]] std::string render_tree(std::vector<std::string> relative_paths);

    /**
     * render_tree() over the reachable set.
     */
    [[nodiscard]] std::string render_used_tree(const analysis::WalkResult& result);

    [[nodiscard]] std::string render_text_report(
        const analysis::WalkResult& result,
        Destination destination = Destination::File
    );

    /**
     * Machine-readable form of the whole result: root, scan directories,
     * roots with their source, counts, used and unused files with their
     * commentable flag, the edge list, the three listings and the
     * diagnostics.
     */
    [[nodiscard]] json to_json(const analysis::WalkResult& result);

    /**
     * Text or JSON report as a string.
     */
    [[nodiscard]] Result<std::string, Error> render_report(
        const analysis::WalkResult& result,
        ReportFormat format,
        Destination destination
    );

    /**
     * Writes a rendered report. A relative @p file_name is placed in
     * @p root.
     *
     * @return The path written.
     */
    [[nodiscard]] Result<fs::path, Error> write_results_file(
        const fs::path& root,
        const fs::path& file_name,
        std::string_view content
    );

    /**
     * Two sections: a tree of the non-backup files, then the backup files
     * as a flat list.
     */
    [[nodiscard]] std::string render_filesystem_view(const analysis::FilesystemView& view);

}  // namespace syswalk::report

#endif //SYSWALK_REPORT_HPP
