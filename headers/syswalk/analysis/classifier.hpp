//
// Created by gregorian-rayne on 10/6/26.
//

#ifndef SYSWALK_CLASSIFIER_HPP
#define SYSWALK_CLASSIFIER_HPP

/**
 * @file classifier.hpp
 * @brief Used / unused partition and directory classification.
 *
 * A directory inside a scan directory owns every collected file below it.
 * - unnecessary: owns at least one file and every owned file is unreachable
 * - keep: owns at least one reachable and one unreachable file
 * - otherwise it is not reported
 */

#include "syswalk/types.hpp"

#include <vector>

namespace syswalk::analysis {

    struct Classification {
        /// Collected files not in the reachable set
        FileSet unreachable;

        std::vector<fs::path> unnecessary_dirs;
        std::vector<fs::path> keep_dirs;

        /// Unreachable files whose parent directory is not unnecessary
        std::vector<fs::path> other_unused_files;
    };

    /**
     * Classifies in two passes: one over each file's ancestor chain to
     * build the owned-file counts, one over the directories.
     *
     * @param files Collected files.
     * @param reachable Reachability result; may contain paths outside @p files.
     * @param scan_dirs Canonical scan directories bounding the directory walk.
     * @param root Project root, used for the listing order.
     */
    [[nodiscard]] Classification classify(
        const FileSet& files,
        const FileSet& reachable,
        const std::vector<fs::path>& scan_dirs,
        const fs::path& root
    );

    /**
     * Sorts paths by their root-relative generic form, case-insensitively
     * with a case-sensitive tie-break.
     */
    void sort_by_relative_path(std::vector<fs::path>& paths, const fs::path& root);

}  // namespace syswalk::analysis

#endif //SYSWALK_CLASSIFIER_HPP
