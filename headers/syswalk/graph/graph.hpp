//
// Created by gregorian-rayne on 10/5/26.
//

#ifndef SYSWALK_GRAPH_HPP
#define SYSWALK_GRAPH_HPP

/**
 * @file graph.hpp
 * @brief Reference graph and reachability.
 *
 * Nodes are canonical file paths, an edge means "source references
 * target". Duplicate edges collapse and cycles are allowed.
 */

#include "syswalk/types.hpp"

#include <map>
#include <set>
#include <vector>

namespace syswalk::graph {

    /**
     * Directed graph over files.
     *
     * Ordered containers keep iteration deterministic, so two graphs built
     * from the same tree compare equal and render identically.
     * Thread-safe for read operations after construction.
     */
    class ReferenceGraph {
    public:
        ReferenceGraph() = default;

        /**
         * Adds a node with no edges. No-op if present.
         */
        void add_node(const fs::path& node);

        /**
         * Adds a directed edge, creating both endpoints as needed.
         *
         * @return true if the edge was new.
         */
        bool add_edge(const fs::path& from, const fs::path& to);

        [[nodiscard]] bool has_node(const fs::path& node) const;

        [[nodiscard]] bool has_edge(const fs::path& from, const fs::path& to) const;

        /**
         * Targets referenced by a node, sorted. Empty for unknown nodes.
         */
        [[nodiscard]] std::vector<fs::path> successors(const fs::path& node) const;

        /**
         * All nodes, sorted.
         */
        [[nodiscard]] std::vector<fs::path> nodes() const;

        [[nodiscard]] std::size_t node_count() const noexcept {
            return adjacency_.size();
        }

        [[nodiscard]] std::size_t edge_count() const noexcept {
            return edge_count_;
        }

        bool operator==(const ReferenceGraph& other) const {
            return adjacency_ == other.adjacency_;
        }

    private:
        std::map<fs::path, std::set<fs::path>> adjacency_;
        std::size_t edge_count_ = 0;
    };

    // ============================================================================
    // Graph Algorithms
    // ============================================================================

    /**
     * Breadth-first search from every root.
     *
     * Roots are always part of the result, including roots with no
     * outgoing edges and roots the graph has never seen. Each node is
     * visited once, so cycles terminate. O(nodes + edges).
     */
    [[nodiscard]] FileSet reachable_from(const ReferenceGraph& graph, const std::vector<fs::path>& roots);

}  // namespace syswalk::graph

#endif //SYSWALK_GRAPH_HPP
