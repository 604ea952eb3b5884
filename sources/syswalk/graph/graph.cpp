//
// Created by gregorian-rayne on 10/5/26.
//

#include "syswalk/graph/graph.hpp"

#include <queue>
#include <ranges>

namespace syswalk::graph {

    // ============================================================================
    // ReferenceGraph Implementation
    // ============================================================================

    void ReferenceGraph::add_node(const fs::path& node) {
        adjacency_.try_emplace(node);
    }

    bool ReferenceGraph::add_edge(const fs::path& from, const fs::path& to) {
        add_node(to);
        const auto [it, inserted] = adjacency_[from].insert(to);
        if (inserted) {
            ++edge_count_;
        }
        return inserted;
    }

    bool ReferenceGraph::has_node(const fs::path& node) const {
        return adjacency_.contains(node);
    }

    bool ReferenceGraph::has_edge(const fs::path& from, const fs::path& to) const {
        const auto it = adjacency_.find(from);
        if (it == adjacency_.end()) return false;
        return it->second.contains(to);
    }

    std::vector<fs::path> ReferenceGraph::successors(const fs::path& node) const {
        if (const auto it = adjacency_.find(node); it != adjacency_.end()) {
            return {it->second.begin(), it->second.end()};
        }
        return {};
    }

    std::vector<fs::path> ReferenceGraph::nodes() const {
        std::vector<fs::path> result;
        result.reserve(adjacency_.size());
        for (const auto& node : adjacency_ | std::views::keys) {
            result.push_back(node);
        }
        return result;
    }

    // ============================================================================
    // Reachability
    // ============================================================================

    FileSet reachable_from(const ReferenceGraph& graph, const std::vector<fs::path>& roots) {
        FileSet visited;
        std::queue<fs::path> queue;

        for (const auto& root : roots) {
            if (visited.insert(root).second) {
                queue.push(root);
            }
        }

        while (!queue.empty()) {
            const auto current = queue.front();
            queue.pop();

            for (const auto& next : graph.successors(current)) {
                if (visited.insert(next).second) {
                    queue.push(next);
                }
            }
        }

        return visited;
    }

}  // namespace syswalk::graph
