//
// Created by gregorian-rayne on 10/5/26.
//

#ifndef SYSWALK_GRAPH_BUILDER_HPP
#define SYSWALK_GRAPH_BUILDER_HPP

/**
 * @file graph_builder.hpp
 * @brief File enumeration and reference graph construction.
 */

#include "syswalk/graph/graph.hpp"
#include "syswalk/extractors/extractor.hpp"

#include <set>
#include <string>
#include <vector>

namespace syswalk::graph {

    /**
     * Files found under the scan directories.
     */
    struct FileCollection {
        FileSet files;
        std::vector<Diagnostic> diagnostics;
    };

    /**
     * Recursively enumerates regular files under each scan directory.
     *
     * A file is kept when its lower-cased extension is in @p extensions;
     * an empty set keeps every file.
     * Entries whose name starts with '.' are skipped (directories are not
     * descended into) unless @p include_hidden is set. Paths are
     * canonicalised, so overlapping scan directories yield each file once.
     * A subtree that cannot be read ends that directory's walk with an
     * EnumerationFailed diagnostic.
     */
    [[nodiscard]] FileCollection collect_files(
        const std::vector<fs::path>& scan_dirs,
        const std::set<std::string>& extensions,
        bool include_hidden
    );

    /**
     * Outgoing edges and notes for one file.
     */
    struct FileAnalysis {
        fs::path file;
        std::vector<fs::path> targets;
        std::vector<Diagnostic> diagnostics;
    };

    struct BuildOutput {
        ReferenceGraph graph;
        std::vector<Diagnostic> diagnostics;
    };

    /**
     * Reads, extracts and resolves every file into a ReferenceGraph.
     *
     * Files are analyzed independently, optionally on a thread pool, and
     * merged in sorted order, so the graph and the diagnostics do not
     * depend on the thread count.
     */
    class GraphBuilder {
    public:
        /**
         * @param extractors Extension -> extractor mapping; must outlive the builder.
         * @param root Canonical project root for "/"-prefixed references.
         */
        GraphBuilder(const extractors::ExtractorSet& extractors, fs::path root);

        /**
         * 0 uses hardware concurrency, 1 (the default) stays on the
         * calling thread.
         */
        void set_max_threads(std::size_t threads) noexcept {
            max_threads_ = threads;
        }

        [[nodiscard]] std::size_t max_threads() const noexcept {
            return max_threads_;
        }

        /**
         * Every file becomes a node, including files with no extractor and
         * files that could not be read.
         */
        [[nodiscard]] BuildOutput build(const FileSet& files) const;

        /**
         * Edges of a single file. Never fails: problems become diagnostics.
         */
        [[nodiscard]] FileAnalysis analyze_file(const fs::path& file) const;

    private:
        const extractors::ExtractorSet& extractors_;
        fs::path root_;
        std::size_t max_threads_ = 1;
    };

}  // namespace syswalk::graph

#endif //SYSWALK_GRAPH_BUILDER_HPP
