//
// Created by gregorian-rayne on 10/6/26.
//

#include "syswalk/analysis/classifier.hpp"
#include "syswalk/utils/path_utils.hpp"
#include "syswalk/utils/string_utils.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace syswalk::analysis {

    namespace {

    struct DirectoryTally {
        std::size_t used = 0;
        std::size_t unused = 0;
    };

    bool inside_scan_scope(const fs::path& dir, const std::vector<fs::path>& scan_dirs) {
        return std::ranges::any_of(scan_dirs, [&dir](const fs::path& scan_dir) {
            return path_utils::is_under(dir, scan_dir);
        });
    }

    }  // namespace

    void sort_by_relative_path(std::vector<fs::path>& paths, const fs::path& root) {
        std::vector<std::pair<std::string, fs::path>> keyed;
        keyed.reserve(paths.size());
        for (auto& path : paths) {
            keyed.emplace_back(path_utils::relative_generic(path, root), std::move(path));
        }

        std::ranges::sort(keyed, [](const auto& a, const auto& b) {
            return string_utils::less_case_insensitive(a.first, b.first);
        });

        paths.clear();
        for (auto& [key, path] : keyed) {
            paths.push_back(std::move(path));
        }
    }

    Classification classify(
        const FileSet& files,
        const FileSet& reachable,
        const std::vector<fs::path>& scan_dirs,
        const fs::path& root
    ) {
        Classification result;
        std::map<fs::path, DirectoryTally> tallies;

        for (const auto& file : files) {
            const bool used = reachable.contains(file);
            if (!used) {
                result.unreachable.insert(file);
            }

            auto dir = file.parent_path();
            while (true) {
                if (inside_scan_scope(dir, scan_dirs)) {
                    auto& tally = tallies[dir];
                    if (used) {
                        ++tally.used;
                    } else {
                        ++tally.unused;
                    }
                }
                if (dir == dir.parent_path()) {
                    break;
                }
                dir = dir.parent_path();
            }
        }

        std::set<fs::path> unnecessary;
        for (const auto& [dir, tally] : tallies) {
            if (tally.used == 0 && tally.unused > 0) {
                unnecessary.insert(dir);
                result.unnecessary_dirs.push_back(dir);
            } else if (tally.used > 0 && tally.unused > 0) {
                result.keep_dirs.push_back(dir);
            }
        }

        for (const auto& file : result.unreachable) {
            if (!unnecessary.contains(file.parent_path())) {
                result.other_unused_files.push_back(file);
            }
        }

        sort_by_relative_path(result.unnecessary_dirs, root);
        sort_by_relative_path(result.keep_dirs, root);
        sort_by_relative_path(result.other_unused_files, root);
        return result;
    }

}  // namespace syswalk::analysis
