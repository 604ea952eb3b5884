//
// Created by gregorian-rayne on 10/6/26.
//

#ifndef SYSWALK_WALKER_HPP
#define SYSWALK_WALKER_HPP

/**
 * @file walker.hpp
 * @brief One analysis run from options to classified result.
 *
 * Pipeline: validate -> collect files -> build graph -> select roots ->
 * reachability -> classify. The run is a pure function of the options,
 * the extractor set and the file tree.
 */

#include "syswalk/analysis/classifier.hpp"
#include "syswalk/analysis/root_selector.hpp"
#include "syswalk/extractors/extractor.hpp"
#include "syswalk/graph/graph.hpp"
#include "syswalk/result.hpp"
#include "syswalk/error.hpp"

#include <vector>

namespace syswalk::analysis {

    struct WalkResult {
        /// Canonical root and scan directories the run used
        fs::path root;
        std::vector<fs::path> scan_dirs;

        FileSet files;
        graph::ReferenceGraph graph;
        RootSelection roots;

        /// Includes every root, and may include files outside files
        FileSet reachable;

        Classification classification;
        std::vector<Diagnostic> diagnostics;

        /**
         * Number of collected files that are reachable.
         */
        [[nodiscard]] std::size_t used_file_count() const;
    };

    /**
     * Checks and normalises options.
     *
     * - An empty root becomes the current directory.
     * - Root and scan directories must be existing directories; relative
     *   scan directories are taken relative to the root. No scan
     *   directories means the root itself.
     * - Extensions are lower-cased and given a leading dot; none means
     *   known_extensions().
     * - A thread count of 0 becomes the hardware concurrency; counts are
     *   capped at parallel::max_pool_size().
     *
     * @return Canonicalised options, or a ConfigError naming the bad path.
     */
    [[nodiscard]] Result<WalkOptions, Error> validate_options(const WalkOptions& options);

    [[nodiscard]] Result<WalkResult, Error> run_walk(
        const WalkOptions& options,
        const extractors::ExtractorSet& extractors
    );

    /**
     * Runs with ExtractorSet::defaults().
     */
    [[nodiscard]] Result<WalkResult, Error> run_walk(const WalkOptions& options);

    /**
     * Plain listing of everything under the scan directories, no analysis.
     */
    struct FilesystemView {
        fs::path root;

        /// Files not named like a backup ("x.bak", "x.bak2")
        std::vector<fs::path> files;

        std::vector<fs::path> backups;
        std::vector<Diagnostic> diagnostics;
    };

    /**
     * Every file under the validated scan directories regardless of
     * extension; hidden entries follow options.include_hidden.
     */
    [[nodiscard]] Result<FilesystemView, Error> collect_filesystem_view(const WalkOptions& options);

}  // namespace syswalk::analysis

#endif //SYSWALK_WALKER_HPP
