//
// Created by gregorian-rayne on 10/9/26.
//

#include "syswalk/cli/commands/command.hpp"

#include "syswalk/syswalk.hpp"
#include "syswalk/core/config.hpp"
#include "syswalk/report/report.hpp"
#include "syswalk/utils/path_utils.hpp"
#include "syswalk/utils/string_utils.hpp"

#include <iostream>
#include <filesystem>

namespace syswalk::cli
{
    namespace fs = std::filesystem;

    namespace {

    std::string describe_roots(const analysis::RootSelection& selection, const fs::path& root) {
        std::string text = std::string(root_source_to_string(selection.source)) + ":";
        for (const auto& path : selection.roots) {
            text += " " + path_utils::relative_generic(path, root);
        }
        return text;
    }

    }  // namespace

    /**
     * Walk command - reachability analysis and the four-section report.
     */
    class WalkCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "walk";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Find files reachable from the entry points and report unused ones";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: syswalk walk [OPTIONS] [SCAN_DIRS...]\n"
                   "\n"
                   "Scan directories are relative to --root (default: the root itself).\n"
                   "\n"
                   "Examples:\n"
                   "  syswalk walk\n"
                   "  syswalk walk --root ~/proj web server\n"
                   "  syswalk walk --roots web/index.html,server/app.py --stdout\n"
                   "  syswalk walk --format json -o walk.json";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"root", 'r', "Project root (default: current directory)", false, true, "", "DIR"},
                {"ext", 'e', "Comma-separated extension allowlist (e.g. .js,.html)", false, true, "", "LIST"},
                {"roots", 0, "Comma-separated entry files, relative to the root", false, true, "", "LIST"},
                {"include-hidden", 0, "Scan dot-files and dot-directories", false, false, "", ""},
                {"stdout", 0, "Print the report instead of writing the results file", false, false, "", ""},
                {"format", 'f', "Report format (text, json)", false, true, "", "FORMAT"},
                {"output", 'o', "Results file, relative to the root", false, true, "", "FILE"},
                {"config", 'c', "Configuration file (default: <root>/.syswalk.toml)", false, true, "", "FILE"},
                {"threads", 'j', "Extraction threads, 0 = all cores", false, true, "", "N"},
                {"fallback-roots", 0, "Markup files used as roots when none are found", false, true, "", "N"},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (auto format = args.get("format"); format && !report::parse_report_format(*format)) {
                return "Unknown format: " + *format + " (expected text or json)";
            }
            for (const auto* option : {"threads", "fallback-roots"}) {
                if (args.has(option)) {
                    if (const auto value = args.get_int(option); !value || *value < 0) {
                        return std::string("--") + option + " expects a non-negative integer";
                    }
                }
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            apply_verbosity(args);

            std::error_code ec;
            const fs::path root = args.has("root") ? fs::path(*args.get("root")) : fs::current_path(ec);
            if (ec) {
                print_error("Cannot determine current directory: " + ec.message());
                return exit_code::InvalidUsage;
            }

            auto config_result = core::load_project_config(root, args.get_or("config", ""));
            if (config_result.is_err()) {
                print_error(config_result.error().to_string());
                return exit_code::InvalidUsage;
            }
            const auto& config = config_result.value();

            auto options = config.to_walk_options(root);
            apply_overrides(args, options);

            auto format = report::parse_report_format(config.report.format).value_or(report::ReportFormat::Text);
            if (args.get_flag("json")) {
                format = report::ReportFormat::Json;
            }
            if (auto requested = args.get("format")) {
                format = report::parse_report_format(*requested).value_or(format);
            }

            print_debug("Root: " + root.string());
            print_debug(std::string("Format: ") + report::report_format_to_string(format));

            auto walk = analysis::run_walk(options);
            if (walk.is_err()) {
                print_error(walk.error().to_string());
                return walk.error().code() == ErrorCode::ConfigError
                    ? exit_code::InvalidUsage
                    : exit_code::RuntimeFailure;
            }
            const auto& result = walk.value();

            log_run(result);

            const auto destination = args.get_flag("stdout")
                ? report::Destination::Console
                : report::Destination::File;
            auto rendered = report::render_report(result, format, destination);
            if (rendered.is_err()) {
                print_error(rendered.error().to_string());
                return exit_code::RuntimeFailure;
            }

            if (destination == report::Destination::Console) {
                std::cout << rendered.value();
                return exit_code::Success;
            }

            const auto file_name = args.get_or(
                "output", config.report.file.value_or(std::string(report::default_results_file(format))));
            auto written = report::write_results_file(result.root, file_name, rendered.value());
            if (written.is_err()) {
                print_error(written.error().to_string());
                return exit_code::RuntimeFailure;
            }

            print("Wrote " + written.value().string() + " (" +
                  std::to_string(result.files.size()) + " files, " +
                  std::to_string(result.used_file_count()) + " used, " +
                  std::to_string(result.classification.unreachable.size()) + " unused)");
            return exit_code::Success;
        }

    private:
        static void apply_overrides(const ParsedArgs& args, WalkOptions& options) {
            if (!args.positional().empty()) {
                options.scan_dirs.clear();
                for (const auto& dir : args.positional()) {
                    options.scan_dirs.emplace_back(dir);
                }
            }
            if (auto ext = args.get("ext")) {
                const auto list = string_utils::split_list(*ext);
                options.extensions = std::set<std::string>(list.begin(), list.end());
            }
            if (auto roots = args.get("roots")) {
                options.explicit_roots = string_utils::split_list(*roots);
            }
            if (args.get_flag("include-hidden")) {
                options.include_hidden = true;
            }
            if (auto threads = args.get_int("threads")) {
                options.max_threads = static_cast<std::size_t>(*threads);
            }
            if (auto limit = args.get_int("fallback-roots")) {
                options.fallback_root_limit = static_cast<std::size_t>(*limit);
            }
        }

        void log_run(const analysis::WalkResult& result) const {
            print_verbose("Root: " + result.root.string());
            for (const auto& dir : result.scan_dirs) {
                print_verbose("Scan directory: " + dir.string());
            }
            print_verbose("Files: " + std::to_string(result.files.size()) +
                          ", edges: " + std::to_string(result.graph.edge_count()));
            print_verbose("Roots (" + describe_roots(result.roots, result.root) + ")");

            for (const auto& entry : result.roots.dropped) {
                print_warning("Entry file not found, ignored: " + entry);
            }
            if (result.roots.source == RootSource::Fallback) {
                print_warning("No entry points found; using the first " +
                              std::to_string(result.roots.roots.size()) +
                              " markup files as roots");
            } else if (result.roots.source == RootSource::None) {
                print_warning("No entry points found; every file is reported unused");
            }

            for (const auto& [kind, file, message] : result.diagnostics) {
                print_verbose(std::string(diagnostic_kind_to_string(kind)) + ": " +
                              path_utils::relative_generic(file, result.root) + ": " + message);
            }

            for (const auto& node : result.graph.nodes()) {
                for (const auto& target : result.graph.successors(node)) {
                    print_debug(path_utils::relative_generic(node, result.root) + " -> " +
                                path_utils::relative_generic(target, result.root));
                }
            }
        }
    };

    namespace {
        struct WalkCommandRegistrar {
            WalkCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<WalkCommand>()
                );
            }
        } walk_registrar;
    }
}  // namespace syswalk::cli
