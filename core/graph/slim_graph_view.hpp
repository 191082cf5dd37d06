#pragma once

#include "graph/directed_graph.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ontograph {

// ─── SlimDirectedGraphView ─────────────────────────────────────
// Read-only, index-addressed snapshot of a DirectedGraph. Vertices are
// numbered 0..n-1 in graph order; parents, children, ancestors and
// descendants are precomputed per index. Ancestors and descendants
// include the vertex itself and are sorted by index.

template <typename T, typename Hash = std::hash<T>>
class SlimDirectedGraphView {
public:
    /// Builds the view; mapper turns each graph vertex into the stored T.
    template <typename V, typename ED, typename GraphHash, typename Mapper>
    static SlimDirectedGraphView create(const DirectedGraph<V, ED, GraphHash>& graph, Mapper mapper) {
        SlimDirectedGraphView view;
        std::vector<V> order = graph.getVertices();
        std::unordered_map<V, int, GraphHash> slot;

        for (size_t i = 0; i < order.size(); i++) {
            int index = static_cast<int>(i);
            slot.emplace(order[i], index);
            view.vertices_.push_back(mapper(order[i]));
            view.index_.emplace(view.vertices_.back(), index);
        }

        size_t n = order.size();
        view.parents_.resize(n);
        view.children_.resize(n);
        view.ancestors_.resize(n);
        view.descendants_.resize(n);

        for (size_t i = 0; i < n; i++) {
            for (const V& p : graph.getParentNodes(order[i])) view.parents_[i].push_back(slot.at(p));
            for (const V& c : graph.getChildNodes(order[i])) view.children_[i].push_back(slot.at(c));

            graph.bfs(order[i], true, [&](const V& v) {
                view.ancestors_[i].push_back(slot.at(v));
                return true;
            });
            graph.bfs(order[i], false, [&](const V& v) {
                view.descendants_[i].push_back(slot.at(v));
                return true;
            });
            std::sort(view.ancestors_[i].begin(), view.ancestors_[i].end());
            std::sort(view.descendants_[i].begin(), view.descendants_[i].end());
        }
        return view;
    }

    /// Identity mapping.
    template <typename ED, typename GraphHash>
    static SlimDirectedGraphView create(const DirectedGraph<T, ED, GraphHash>& graph) {
        return create(graph, [](const T& v) { return v; });
    }

    size_t getNumberOfVertices() const { return vertices_.size(); }
    const T& getVertex(int index) const { return vertices_.at(static_cast<size_t>(index)); }
    const std::vector<T>& getVertices() const { return vertices_; }

    std::optional<int> getVertexIndex(const T& vertex) const {
        auto it = index_.find(vertex);
        if (it == index_.end()) return std::nullopt;
        return it->second;
    }
    bool isVertexIncluded(const T& vertex) const { return index_.count(vertex) > 0; }

    const std::vector<int>& getParents(int index) const { return parents_.at(static_cast<size_t>(index)); }
    const std::vector<int>& getChildren(int index) const { return children_.at(static_cast<size_t>(index)); }
    const std::vector<int>& getAncestors(int index) const { return ancestors_.at(static_cast<size_t>(index)); }
    const std::vector<int>& getDescendants(int index) const { return descendants_.at(static_cast<size_t>(index)); }

    /// True if ancestor is an ancestor of (or equal to) index.
    bool isAncestor(int index, int ancestor) const {
        const auto& list = getAncestors(index);
        return std::binary_search(list.begin(), list.end(), ancestor);
    }

    /// True if descendant is a descendant of (or equal to) index.
    bool isDescendant(int index, int descendant) const {
        const auto& list = getDescendants(index);
        return std::binary_search(list.begin(), list.end(), descendant);
    }

private:
    SlimDirectedGraphView() = default;

    std::vector<T> vertices_;
    std::unordered_map<T, int, Hash> index_;
    std::vector<std::vector<int>> parents_;
    std::vector<std::vector<int>> children_;
    std::vector<std::vector<int>> ancestors_;
    std::vector<std::vector<int>> descendants_;
};

} // namespace ontograph
