//
// Created by gregorian-rayne on 10/9/26.
//

#include "syswalk/cli/commands/command.hpp"

#include "syswalk/syswalk.hpp"
#include "syswalk/report/report.hpp"

#include <iostream>
#include <filesystem>

namespace syswalk::cli
{
    namespace fs = std::filesystem;

    /**
     * Tree command - lists the scan directories without analysis, with
     * backup files (*.bak, *.bakN) listed separately.
     */
    class TreeCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "tree";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Show the scanned files as a tree, backups listed apart";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: syswalk tree [OPTIONS] [SCAN_DIRS...]\n"
                   "\n"
                   "Examples:\n"
                   "  syswalk tree\n"
                   "  syswalk tree --root ~/proj web --include-hidden";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"root", 'r', "Project root (default: current directory)", false, true, "", "DIR"},
                {"include-hidden", 0, "Show dot-files and dot-directories", false, false, "", ""},
            };
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            apply_verbosity(args);

            WalkOptions options;
            if (auto root = args.get("root")) {
                options.root = *root;
            }
            for (const auto& dir : args.positional()) {
                options.scan_dirs.emplace_back(dir);
            }
            options.include_hidden = args.get_flag("include-hidden");

            auto view = analysis::collect_filesystem_view(options);
            if (view.is_err()) {
                print_error(view.error().to_string());
                return view.error().code() == ErrorCode::ConfigError
                    ? exit_code::InvalidUsage
                    : exit_code::RuntimeFailure;
            }

            for (const auto& [kind, file, message] : view.value().diagnostics) {
                print_warning(std::string(diagnostic_kind_to_string(kind)) + ": " +
                              file.string() + ": " + message);
            }

            std::cout << report::render_filesystem_view(view.value());
            return exit_code::Success;
        }
    };

    namespace {
        struct TreeCommandRegistrar {
            TreeCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<TreeCommand>()
                );
            }
        } tree_registrar;
    }
}  // namespace syswalk::cli
