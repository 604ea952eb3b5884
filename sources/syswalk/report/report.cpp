//
// Created by gregorian-rayne on 10/7/26.
//

#include "syswalk/report/report.hpp"
#include "syswalk/utils/file_utils.hpp"
#include "syswalk/utils/json_utils.hpp"
#include "syswalk/utils/path_utils.hpp"
#include "syswalk/utils/string_utils.hpp"

#include <algorithm>
#include <sstream>

namespace syswalk::report {

    namespace {

    std::vector<std::string> relative_paths(const std::vector<fs::path>& paths, const fs::path& root) {
        std::vector<std::string> result;
        result.reserve(paths.size());
        for (const auto& path : paths) {
            result.push_back(path_utils::relative_generic(path, root));
        }
        return result;
    }

    std::vector<std::string> relative_paths(const FileSet& paths, const fs::path& root) {
        return relative_paths(std::vector<fs::path>(paths.begin(), paths.end()), root);
    }

    void append_listing(std::ostringstream& out, const std::vector<std::string>& items) {
        if (items.empty()) {
            out << "(none)\n";
            return;
        }
        for (const auto& item : items) {
            out << "- " << item << "\n";
        }
    }

    json file_entries(const std::vector<fs::path>& files, const fs::path& root) {
        json entries = json::array();
        for (const auto& file : files) {
            const auto source = SourceFile::from_path(file);
            entries.push_back({
                {"path", path_utils::relative_generic(file, root)},
                {"family", file_family_to_string(source.family)},
                {"commentable", source.commentable}
            });
        }
        return entries;
    }

    }  // namespace

    const char* report_format_to_string(const ReportFormat format) noexcept {
        switch (format) {
            case ReportFormat::Text: return "text";
            case ReportFormat::Json: return "json";
        }
        return "unknown";
    }

    std::optional<ReportFormat> parse_report_format(const std::string_view name) {
        const auto lowered = string_utils::to_lower(string_utils::trim(name));
        if (lowered == "text") return ReportFormat::Text;
        if (lowered == "json") return ReportFormat::Json;
        return std::nullopt;
    }

    std::string_view default_results_file(const ReportFormat format) noexcept {
        return format == ReportFormat::Json ? DEFAULT_JSON_RESULTS_FILE : DEFAULT_RESULTS_FILE;
    }

    std::string render_tree(std::vector<std::string> relative_paths) {
        std::ranges::sort(relative_paths, [](const std::string& a, const std::string& b) {
            return string_utils::less_case_insensitive(a, b);
        });

        std::ostringstream out;
        std::vector<std::string> previous;
        bool any = false;

        for (const auto& rel : relative_paths) {
            const auto parts = path_utils::segments(rel);

            std::size_t shared = 0;
            while (shared < parts.size() && shared < previous.size() && parts[shared] == previous[shared]) {
                ++shared;
            }

            for (std::size_t depth = shared; depth < parts.size(); ++depth) {
                if (any) {
                    out << "\n";
                }
                out << std::string(depth * 2, ' ') << parts[depth];
                any = true;
            }
            previous = parts;
        }

        return any ? out.str() : "(none)";
    }

    std::string render_used_tree(const analysis::WalkResult& result) {
        return render_tree(relative_paths(result.reachable, result.root));
    }

    std::string render_text_report(const analysis::WalkResult& result, const Destination destination) {
        const auto& classification = result.classification;
        std::ostringstream out;

        out << (destination == Destination::Console ? "# System Walk Results (STDOUT)" : "# System Walk Results")
            << "\n\n";

        out << "## Section 1 - Used files (directory tree)\n\n";
        out << render_used_tree(result) << "\n\n";

        out << "## Section 2 - Unnecessary folders (all files unused)\n\n";
        append_listing(out, relative_paths(classification.unnecessary_dirs, result.root));

        out << "\n## Section 3 - Keep folders (mixed; keep at least listed used files)\n\n";
        append_listing(out, relative_paths(classification.keep_dirs, result.root));

        out << "\n## Section 4 - Other unused files (deletable candidates)\n\n";
        append_listing(out, relative_paths(classification.other_unused_files, result.root));

        return out.str();
    }

    json to_json(const analysis::WalkResult& result) {
        const auto& root = result.root;
        const auto& classification = result.classification;

        json output;
        output["root"] = root.generic_string();

        json scan_dirs = json::array();
        for (const auto& dir : result.scan_dirs) {
            scan_dirs.push_back(path_utils::relative_generic(dir, root));
        }
        output["scan_dirs"] = scan_dirs;

        json roots;
        roots["source"] = root_source_to_string(result.roots.source);
        roots["files"] = relative_paths(result.roots.roots, root);
        roots["dropped"] = result.roots.dropped;
        output["roots"] = roots;

        json summary;
        summary["files"] = result.files.size();
        summary["reachable"] = result.reachable.size();
        summary["used_files"] = result.used_file_count();
        summary["unused_files"] = classification.unreachable.size();
        summary["edges"] = result.graph.edge_count();
        summary["unnecessary_dirs"] = classification.unnecessary_dirs.size();
        summary["keep_dirs"] = classification.keep_dirs.size();
        summary["diagnostics"] = result.diagnostics.size();
        output["summary"] = summary;

        std::vector<fs::path> used(result.reachable.begin(), result.reachable.end());
        analysis::sort_by_relative_path(used, root);
        output["used_files"] = file_entries(used, root);

        std::vector<fs::path> unused(classification.unreachable.begin(), classification.unreachable.end());
        analysis::sort_by_relative_path(unused, root);
        output["unused_files"] = file_entries(unused, root);

        json edges = json::array();
        for (const auto& node : result.graph.nodes()) {
            for (const auto& target : result.graph.successors(node)) {
                edges.push_back({
                    {"source", path_utils::relative_generic(node, root)},
                    {"target", path_utils::relative_generic(target, root)}
                });
            }
        }
        output["edges"] = edges;

        output["unnecessary_dirs"] = relative_paths(classification.unnecessary_dirs, root);
        output["keep_dirs"] = relative_paths(classification.keep_dirs, root);
        output["other_unused_files"] = relative_paths(classification.other_unused_files, root);

        json diagnostics = json::array();
        for (const auto& [kind, file, message] : result.diagnostics) {
            diagnostics.push_back({
                {"kind", diagnostic_kind_to_string(kind)},
                {"file", path_utils::relative_generic(file, root)},
                {"message", message}
            });
        }
        output["diagnostics"] = diagnostics;

        return output;
    }

    Result<std::string, Error> render_report(
        const analysis::WalkResult& result,
        const ReportFormat format,
        const Destination destination
    ) {
        if (format == ReportFormat::Json) {
            auto text = json_utils::dump(to_json(result));
            if (text.is_err()) {
                return text;
            }
            return Result<std::string, Error>::success(std::move(text).value() + "\n");
        }
        return Result<std::string, Error>::success(render_text_report(result, destination));
    }

    Result<fs::path, Error> write_results_file(
        const fs::path& root,
        const fs::path& file_name,
        const std::string_view content
    ) {
        const auto target = file_name.is_absolute() ? file_name : root / file_name;
        if (auto written = file_utils::write_file(target, content); written.is_err()) {
            return Result<fs::path, Error>::failure(written.error());
        }
        return Result<fs::path, Error>::success(target);
    }

    std::string render_filesystem_view(const analysis::FilesystemView& view) {
        std::ostringstream out;
        out << "# Filesystem View (STDOUT)\n\n";

        out << "## Section A - Directory tree (non-backup files)\n\n";
        out << render_tree(relative_paths(view.files, view.root)) << "\n\n";

        out << "## Section B - Backup files\n\n";
        append_listing(out, relative_paths(view.backups, view.root));

        return out.str();
    }

}  // namespace syswalk::report
