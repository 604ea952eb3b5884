//
// Created by gregorian-rayne on 10/6/26.
//

#include "syswalk/analysis/root_selector.hpp"
#include "syswalk/utils/path_utils.hpp"

#include <algorithm>
#include <system_error>

namespace syswalk::analysis {

    namespace {

    bool is_regular_file(const fs::path& path) {
        std::error_code ec;
        return fs::is_regular_file(path, ec);
    }

    void push_unique(std::vector<fs::path>& roots, fs::path path) {
        if (std::ranges::find(roots, path) == roots.end()) {
            roots.push_back(std::move(path));
        }
    }

    }  // namespace

    std::vector<fs::path> existing_explicit_roots(
        const fs::path& root,
        const std::vector<std::string>& entries,
        std::vector<std::string>* dropped
    ) {
        std::vector<fs::path> roots;
        for (const auto& entry : entries) {
            fs::path candidate(entry);
            if (!candidate.is_absolute()) {
                candidate = root / candidate;
            }
            if (analysis::is_regular_file(candidate)) {
                push_unique(roots, path_utils::canonical_path(candidate));
            } else if (dropped) {
                dropped->push_back(entry);
            }
        }
        return roots;
    }

    std::vector<fs::path> convention_roots(const fs::path& root, const std::vector<fs::path>& scan_dirs) {
        std::vector<fs::path> roots;

        for (const auto name : CONVENTIONAL_ROOTS) {
            if (const auto candidate = root / fs::path(name); analysis::is_regular_file(candidate)) {
                push_unique(roots, path_utils::canonical_path(candidate));
            }
        }

        for (const auto& dir : scan_dirs) {
            for (const auto name : SCAN_DIR_INDEX_NAMES) {
                if (const auto candidate = dir / fs::path(name); analysis::is_regular_file(candidate)) {
                    push_unique(roots, path_utils::canonical_path(candidate));
                }
            }
        }

        return roots;
    }

    std::vector<fs::path> fallback_roots(const FileSet& files, const std::size_t limit) {
        std::vector<fs::path> roots;
        for (const auto& file : files) {
            if (roots.size() >= limit) {
                break;
            }
            if (file_family_for(lower_extension(file)) == FileFamily::Markup) {
                roots.push_back(file);
            }
        }
        return roots;
    }

    RootSelection select_roots(
        const fs::path& root,
        const std::vector<fs::path>& scan_dirs,
        const FileSet& files,
        const std::vector<std::string>& explicit_entries,
        const std::size_t fallback_limit
    ) {
        RootSelection selection;

        if (!explicit_entries.empty()) {
            selection.roots = existing_explicit_roots(root, explicit_entries, &selection.dropped);
            if (!selection.roots.empty()) {
                selection.source = RootSource::Explicit;
                return selection;
            }
        }

        selection.roots = convention_roots(root, scan_dirs);
        if (!selection.roots.empty()) {
            selection.source = RootSource::Convention;
            return selection;
        }

        selection.roots = fallback_roots(files, fallback_limit);
        selection.source = selection.roots.empty() ? RootSource::None : RootSource::Fallback;
        return selection;
    }

}  // namespace syswalk::analysis
