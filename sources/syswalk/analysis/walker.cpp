//
// Created by gregorian-rayne on 10/6/26.
//

#include "syswalk/analysis/walker.hpp"
#include "syswalk/graph/graph_builder.hpp"
#include "syswalk/utils/file_utils.hpp"
#include "syswalk/utils/parallel.hpp"
#include "syswalk/utils/path_utils.hpp"
#include "syswalk/utils/string_utils.hpp"

#include <algorithm>
#include <system_error>

namespace syswalk::analysis {

    namespace {

    bool is_directory(const fs::path& path) {
        std::error_code ec;
        return fs::is_directory(path, ec);
    }

    }  // namespace

    std::size_t WalkResult::used_file_count() const {
        return static_cast<std::size_t>(std::ranges::count_if(files, [this](const fs::path& file) {
            return reachable.contains(file);
        }));
    }

    Result<WalkOptions, Error> validate_options(const WalkOptions& options) {
        WalkOptions validated = options;

        if (validated.root.empty()) {
            std::error_code ec;
            validated.root = fs::current_path(ec);
            if (ec) {
                return Result<WalkOptions, Error>::failure(
                    Error::config_error("Cannot determine current directory", ec.message())
                );
            }
        }

        if (!analysis::is_directory(validated.root)) {
            return Result<WalkOptions, Error>::failure(
                Error::config_error("Root is not an existing directory", validated.root.string())
            );
        }
        validated.root = path_utils::canonical_path(validated.root);

        validated.scan_dirs.clear();
        if (options.scan_dirs.empty()) {
            validated.scan_dirs.push_back(validated.root);
        }
        for (const auto& dir : options.scan_dirs) {
            const auto candidate = dir.is_absolute() ? dir : validated.root / dir;
            if (!analysis::is_directory(candidate)) {
                return Result<WalkOptions, Error>::failure(
                    Error::config_error("Scan directory is not an existing directory", candidate.string())
                );
            }
            auto canonical = path_utils::canonical_path(candidate);
            if (std::ranges::find(validated.scan_dirs, canonical) == validated.scan_dirs.end()) {
                validated.scan_dirs.push_back(std::move(canonical));
            }
        }

        validated.extensions.clear();
        for (const auto& ext : options.extensions) {
            auto normalized = string_utils::to_lower(string_utils::trim(ext));
            if (normalized.empty()) {
                continue;
            }
            if (normalized.front() != '.') {
                normalized.insert(normalized.begin(), '.');
            }
            validated.extensions.insert(std::move(normalized));
        }
        if (validated.extensions.empty()) {
            validated.extensions = known_extensions();
        }

        const std::size_t thread_limit = parallel::max_pool_size();
        if (validated.max_threads == 0) {
            validated.max_threads = parallel::hardware_concurrency();
        }
        validated.max_threads = std::min(validated.max_threads, thread_limit);

        return Result<WalkOptions, Error>::success(std::move(validated));
    }

    Result<WalkResult, Error> run_walk(
        const WalkOptions& options,
        const extractors::ExtractorSet& extractors
    ) {
        auto validated = validate_options(options);
        if (validated.is_err()) {
            return Result<WalkResult, Error>::failure(validated.error());
        }
        const auto& opts = validated.value();

        WalkResult result;
        result.root = opts.root;
        result.scan_dirs = opts.scan_dirs;

        auto collection = graph::collect_files(opts.scan_dirs, opts.extensions, opts.include_hidden);
        result.files = std::move(collection.files);
        result.diagnostics = std::move(collection.diagnostics);

        graph::GraphBuilder builder(extractors, opts.root);
        builder.set_max_threads(opts.max_threads);
        auto built = builder.build(result.files);
        result.graph = std::move(built.graph);
        for (auto& diagnostic : built.diagnostics) {
            result.diagnostics.push_back(std::move(diagnostic));
        }

        result.roots = select_roots(opts.root, opts.scan_dirs, result.files,
                                    opts.explicit_roots, opts.fallback_root_limit);
        result.reachable = graph::reachable_from(result.graph, result.roots.roots);
        result.classification = classify(result.files, result.reachable, opts.scan_dirs, opts.root);

        return Result<WalkResult, Error>::success(std::move(result));
    }

    Result<WalkResult, Error> run_walk(const WalkOptions& options) {
        const auto extractors = extractors::ExtractorSet::defaults();
        return run_walk(options, extractors);
    }

    Result<FilesystemView, Error> collect_filesystem_view(const WalkOptions& options) {
        auto validated = validate_options(options);
        if (validated.is_err()) {
            return Result<FilesystemView, Error>::failure(validated.error());
        }
        const auto& opts = validated.value();

        auto collection = graph::collect_files(opts.scan_dirs, {}, opts.include_hidden);

        FilesystemView view;
        view.root = opts.root;
        view.diagnostics = std::move(collection.diagnostics);
        for (const auto& file : collection.files) {
            if (file_utils::is_backup_file(file)) {
                view.backups.push_back(file);
            } else {
                view.files.push_back(file);
            }
        }
        sort_by_relative_path(view.backups, view.root);

        return Result<FilesystemView, Error>::success(std::move(view));
    }

}  // namespace syswalk::analysis
