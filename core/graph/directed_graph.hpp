#pragma once

#include "graph/edge.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace ontograph {

/// Raised by the Bellman-Ford routines when distances still change after
/// |V| relaxation rounds, i.e. the graph contains a cycle of negative weight.
class NegativeCycleError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

namespace detail {

template <typename V>
std::string describeVertex(const V& vertex) {
    std::ostringstream os;
    os << vertex;
    return os.str();
}

} // namespace detail

// ─── DirectedGraph ─────────────────────────────────────────────
// Directed graph without multi-edges. Vertex records and edges live in
// index-addressed arenas; a hash index maps a vertex to its slot. Each
// vertex keeps ordered lists of incoming and outgoing edge indices, so
// iteration follows insertion order and is deterministic.
//
// Read operations may run concurrently. Mutations need external
// serialization and must not overlap with traversals.

template <typename V, typename ED, typename Hash = std::hash<V>>
class DirectedGraph {
public:
    using EdgeType = Edge<V, ED>;
    using VertexSet = std::unordered_set<V, Hash>;

    /// Called once per discovered vertex. Return false to stop the walk.
    using VertexVisitor = std::function<bool(const V&)>;

    /// Decides whether a traversal follows an edge.
    using EdgeFilter = std::function<bool(const EdgeType&)>;

    /// Returns true for edge data that subGraph() should leave out.
    using EdgeDataFilter = std::function<bool(const ED&)>;

    /// Combines the data of edges that are collapsed into a single edge.
    using EdgeDataMerger = std::function<ED(const std::vector<ED>&)>;

    /// Maps an edge to its (integral) weight.
    using EdgeWeighter = std::function<int(const V& source, const V& dest, const ED& data)>;

    /// Receives a vertex, the path from the source to it and its distance.
    /// Return false to stop reporting.
    using DistanceVisitor = std::function<bool(const V& vertex, const std::vector<V>& path, int distance)>;

    DirectedGraph() = default;

    // ── Vertex operations ──
    void addVertex(const V& vertex);
    void removeVertex(const V& vertex);
    void removeVertexMaintainConnectivity(const V& vertex,
                                          const EdgeDataMerger& merger = nullptr);
    bool containsVertex(const V& vertex) const { return index_.count(vertex) > 0; }
    size_t vertexCount() const { return index_.size(); }
    std::vector<V> getVertices() const;

    // ── Edge operations ──
    void addEdge(const V& source, const V& dest, ED data = ED{});
    bool removeEdge(const V& source, const V& dest);
    void removeConnections(const V& source, const V& dest);
    bool hasEdge(const V& source, const V& dest) const;

    /// The edge source → dest or nullptr. The pointer is valid until the
    /// next mutation of the graph.
    const EdgeType* getEdge(const V& source, const V& dest) const;
    size_t edgeCount() const { return edge_count_; }

    // ── Adjacency queries ──
    size_t inDegree(const V& vertex) const;
    size_t outDegree(const V& vertex) const;
    std::vector<EdgeType> getInEdges(const V& vertex) const;
    std::vector<EdgeType> getOutEdges(const V& vertex) const;
    std::vector<V> getParentNodes(const V& vertex) const;
    std::vector<V> getChildNodes(const V& vertex) const;

    /// True if a and b are the same vertex or an edge joins them in either
    /// direction.
    bool areNeighbors(const V& a, const V& b) const;

    // ── Traversal ──

    /// Breadth-first walk from one or more start vertices. The start
    /// vertices are visited first. With against_flow the walk follows
    /// incoming edges, otherwise outgoing ones.
    void bfs(const V& start, bool against_flow, const VertexVisitor& visitor,
             const EdgeFilter& follow = nullptr) const;
    void bfs(const std::vector<V>& starts, bool against_flow, const VertexVisitor& visitor,
             const EdgeFilter& follow = nullptr) const;

    /// True if a directed path leads from source to dest.
    bool existsPath(const V& source, const V& dest) const;

    /// Number of distinct directed paths from source to dest; 1 when they
    /// are the same vertex. Throws std::runtime_error if a cycle is
    /// reachable from source on the way to dest.
    size_t getNumberOfPaths(const V& source, const V& dest) const;

    /// Ancestors of vertex (inclusive). With a root, only ancestors that
    /// are the root or reachable from it are reported.
    VertexSet getVerticesOfUpperInducedGraph(const std::optional<V>& root, const V& vertex) const;

    /// Vertices in an order where every edge points forward.
    std::vector<V> topologicalOrder() const;

    // ── Weighted paths ──

    /// Dijkstra. Weights must be non-negative; a null weighter weighs
    /// each edge 1. Results are reported in order of increasing distance.
    void singleSourceShortestPath(const V& source, bool against_flow,
                                  const DistanceVisitor& visitor,
                                  const EdgeWeighter& weighter = nullptr) const;

    /// Bellman-Ford with every weight multiplied by weight_multiplier.
    void bellmanFord(const V& source, int weight_multiplier, const DistanceVisitor& visitor,
                     const EdgeWeighter& weighter = nullptr) const;
    void singleSourceShortestPathBF(const V& source, const DistanceVisitor& visitor,
                                    const EdgeWeighter& weighter = nullptr) const;
    void singleSourceLongestPath(const V& source, const DistanceVisitor& visitor,
                                 const EdgeWeighter& weighter = nullptr) const;

    // ── Derived graphs ──

    /// Graph over the given vertices with the edges spanned between them.
    DirectedGraph subGraph(const VertexSet& vertices,
                           const EdgeDataFilter& leave_out = nullptr) const;

    /// One edge (with default data) for every ordered pair of distinct
    /// vertices of the set that are connected by a path.
    DirectedGraph transitiveClosureOfSubGraph(const VertexSet& vertices) const;

    /// Graph over the given vertices that keeps exactly the reachability
    /// among them and contains no redundant edge.
    DirectedGraph pathMaintainingSubGraph(const VertexSet& vertices,
                                          const EdgeDataMerger& merger = nullptr) const;

    /// Structural copy; also drops the slots of removed vertices and edges.
    DirectedGraph clone() const;

    // ── Merging ──

    /// Moves every edge of the equivalent vertices onto the representative
    /// and removes the equivalents. All vertices are checked before the
    /// graph changes; a repeated equivalent is merged once.
    void mergeVertices(const V& representative, const std::vector<V>& equivalents);

private:
    static constexpr size_t npos = static_cast<size_t>(-1);

    struct VertexRecord {
        V vertex;
        std::vector<size_t> in_edges;
        std::vector<size_t> out_edges;
        bool alive = true;
    };

    struct EdgeRecord {
        EdgeType edge;
        size_t source_slot = 0;
        size_t dest_slot = 0;
        bool alive = true;
    };

    size_t findSlot(const V& vertex) const;
    size_t slotOf(const V& vertex) const;
    size_t findEdge(size_t source_slot, size_t dest_slot) const;
    void unlinkEdge(size_t edge_index);
    int weightOf(const EdgeType& edge, const EdgeWeighter& weighter) const;
    std::vector<V> pathTo(size_t slot, const std::vector<size_t>& parent) const;
    size_t countPaths(size_t slot, size_t dest_slot, std::vector<size_t>& memo,
                      std::vector<char>& on_stack) const;
    DirectedGraph compactedSubgraph(const VertexSet& vertices, const EdgeDataMerger& merger) const;

    std::vector<VertexRecord> vertices_;
    std::unordered_map<V, size_t, Hash> index_;
    std::vector<EdgeRecord> edges_;
    std::vector<size_t> free_edges_;
    size_t edge_count_ = 0;
};

// ─── Slot helpers ──────────────────────────────────────────────

template <typename V, typename ED, typename Hash>
size_t DirectedGraph<V, ED, Hash>::findSlot(const V& vertex) const {
    auto it = index_.find(vertex);
    return it != index_.end() ? it->second : npos;
}

template <typename V, typename ED, typename Hash>
size_t DirectedGraph<V, ED, Hash>::slotOf(const V& vertex) const {
    size_t slot = findSlot(vertex);
    if (slot == npos)
        throw std::runtime_error("Vertex not in graph: " + detail::describeVertex(vertex));
    return slot;
}

template <typename V, typename ED, typename Hash>
size_t DirectedGraph<V, ED, Hash>::findEdge(size_t source_slot, size_t dest_slot) const {
    for (size_t ei : vertices_[source_slot].out_edges) {
        if (edges_[ei].dest_slot == dest_slot) return ei;
    }
    return npos;
}

template <typename V, typename ED, typename Hash>
void DirectedGraph<V, ED, Hash>::unlinkEdge(size_t edge_index) {
    EdgeRecord& rec = edges_[edge_index];
    auto& out = vertices_[rec.source_slot].out_edges;
    out.erase(std::find(out.begin(), out.end(), edge_index));
    auto& in = vertices_[rec.dest_slot].in_edges;
    in.erase(std::find(in.begin(), in.end(), edge_index));
    rec.alive = false;
    rec.edge.data = ED{};
    free_edges_.push_back(edge_index);
    edge_count_--;
}

// ─── Vertex operations ─────────────────────────────────────────

template <typename V, typename ED, typename Hash>
void DirectedGraph<V, ED, Hash>::addVertex(const V& vertex) {
    if (index_.count(vertex)) return;
    VertexRecord rec;
    rec.vertex = vertex;
    vertices_.push_back(std::move(rec));
    index_.emplace(vertex, vertices_.size() - 1);
}

template <typename V, typename ED, typename Hash>
void DirectedGraph<V, ED, Hash>::removeVertex(const V& vertex) {
    size_t slot = findSlot(vertex);
    if (slot == npos) return;

    VertexRecord& rec = vertices_[slot];
    while (!rec.in_edges.empty()) unlinkEdge(rec.in_edges.back());
    while (!rec.out_edges.empty()) unlinkEdge(rec.out_edges.back());

    rec.alive = false;
    index_.erase(vertex);
}

template <typename V, typename ED, typename Hash>
void DirectedGraph<V, ED, Hash>::removeVertexMaintainConnectivity(const V& vertex,
                                                                 const EdgeDataMerger& merger) {
    std::vector<EdgeType> ins = getInEdges(vertex);
    std::vector<EdgeType> outs = getOutEdges(vertex);

    // Connect the source of each in edge to the dest of each out edge
    for (const EdgeType& i : ins) {
        for (const EdgeType& o : outs) {
            // A cycle through vertex would collapse into a self-loop
            if (i.source == o.dest) continue;

            const EdgeType* current = getEdge(i.source, o.dest);
            ED data{};
            if (merger) {
                std::vector<ED> parts{i.data, o.data};
                if (current) parts.push_back(current->data);
                data = merger(parts);
            }
            if (current) removeEdge(i.source, o.dest);
            addEdge(i.source, o.dest, std::move(data));
        }
    }

    removeVertex(vertex);
}

template <typename V, typename ED, typename Hash>
std::vector<V> DirectedGraph<V, ED, Hash>::getVertices() const {
    std::vector<V> result;
    result.reserve(index_.size());
    for (const auto& rec : vertices_) {
        if (rec.alive) result.push_back(rec.vertex);
    }
    return result;
}

// ─── Edge operations ───────────────────────────────────────────

template <typename V, typename ED, typename Hash>
void DirectedGraph<V, ED, Hash>::addEdge(const V& source, const V& dest, ED data) {
    size_t s = findSlot(source);
    size_t d = findSlot(dest);
    if (s == npos || d == npos) {
        throw std::runtime_error("Cannot add edge " + detail::describeVertex(source) + " -> " +
                                 detail::describeVertex(dest) + ": endpoint not in graph");
    }

    EdgeRecord rec;
    rec.edge = EdgeType(source, dest, std::move(data));
    rec.source_slot = s;
    rec.dest_slot = d;

    size_t ei;
    if (!free_edges_.empty()) {
        ei = free_edges_.back();
        free_edges_.pop_back();
        edges_[ei] = std::move(rec);
    } else {
        ei = edges_.size();
        edges_.push_back(std::move(rec));
    }

    vertices_[s].out_edges.push_back(ei);
    vertices_[d].in_edges.push_back(ei);
    edge_count_++;
}

template <typename V, typename ED, typename Hash>
bool DirectedGraph<V, ED, Hash>::removeEdge(const V& source, const V& dest) {
    size_t s = slotOf(source);
    size_t d = slotOf(dest);
    size_t ei = findEdge(s, d);
    if (ei == npos) return false;
    unlinkEdge(ei);
    return true;
}

template <typename V, typename ED, typename Hash>
void DirectedGraph<V, ED, Hash>::removeConnections(const V& source, const V& dest) {
    size_t s = slotOf(source);
    size_t d = slotOf(dest);

    auto collect = [this](size_t from, size_t to) {
        std::vector<size_t> found;
        for (size_t ei : vertices_[from].out_edges) {
            if (edges_[ei].dest_slot == to) found.push_back(ei);
        }
        size_t mirrored = 0;
        for (size_t ei : vertices_[to].in_edges) {
            if (edges_[ei].source_slot == from) mirrored++;
        }
        if (found.size() > 1 || mirrored != found.size()) {
            throw std::logic_error("Inconsistent edges between " +
                                   detail::describeVertex(vertices_[from].vertex) + " and " +
                                   detail::describeVertex(vertices_[to].vertex) + ": " +
                                   std::to_string(found.size()) + " outgoing, " +
                                   std::to_string(mirrored) + " incoming");
        }
        return found;
    };

    std::vector<size_t> forward = collect(s, d);
    std::vector<size_t> backward = s != d ? collect(d, s) : std::vector<size_t>{};
    for (size_t ei : forward) unlinkEdge(ei);
    for (size_t ei : backward) unlinkEdge(ei);
}

template <typename V, typename ED, typename Hash>
bool DirectedGraph<V, ED, Hash>::hasEdge(const V& source, const V& dest) const {
    size_t s = slotOf(source);
    size_t d = findSlot(dest);
    if (d == npos) return false;
    return findEdge(s, d) != npos;
}

template <typename V, typename ED, typename Hash>
const typename DirectedGraph<V, ED, Hash>::EdgeType*
DirectedGraph<V, ED, Hash>::getEdge(const V& source, const V& dest) const {
    size_t s = slotOf(source);
    size_t d = findSlot(dest);
    if (d == npos) return nullptr;
    size_t ei = findEdge(s, d);
    return ei != npos ? &edges_[ei].edge : nullptr;
}

// ─── Adjacency queries ─────────────────────────────────────────

template <typename V, typename ED, typename Hash>
size_t DirectedGraph<V, ED, Hash>::inDegree(const V& vertex) const {
    return vertices_[slotOf(vertex)].in_edges.size();
}

template <typename V, typename ED, typename Hash>
size_t DirectedGraph<V, ED, Hash>::outDegree(const V& vertex) const {
    return vertices_[slotOf(vertex)].out_edges.size();
}

template <typename V, typename ED, typename Hash>
std::vector<typename DirectedGraph<V, ED, Hash>::EdgeType>
DirectedGraph<V, ED, Hash>::getInEdges(const V& vertex) const {
    std::vector<EdgeType> result;
    for (size_t ei : vertices_[slotOf(vertex)].in_edges) result.push_back(edges_[ei].edge);
    return result;
}

template <typename V, typename ED, typename Hash>
std::vector<typename DirectedGraph<V, ED, Hash>::EdgeType>
DirectedGraph<V, ED, Hash>::getOutEdges(const V& vertex) const {
    std::vector<EdgeType> result;
    for (size_t ei : vertices_[slotOf(vertex)].out_edges) result.push_back(edges_[ei].edge);
    return result;
}

template <typename V, typename ED, typename Hash>
std::vector<V> DirectedGraph<V, ED, Hash>::getParentNodes(const V& vertex) const {
    std::vector<V> result;
    for (size_t ei : vertices_[slotOf(vertex)].in_edges) result.push_back(edges_[ei].edge.source);
    return result;
}

template <typename V, typename ED, typename Hash>
std::vector<V> DirectedGraph<V, ED, Hash>::getChildNodes(const V& vertex) const {
    std::vector<V> result;
    for (size_t ei : vertices_[slotOf(vertex)].out_edges) result.push_back(edges_[ei].edge.dest);
    return result;
}

template <typename V, typename ED, typename Hash>
bool DirectedGraph<V, ED, Hash>::areNeighbors(const V& a, const V& b) const {
    size_t sa = slotOf(a);
    if (a == b) return true;
    size_t sb = findSlot(b);
    if (sb == npos) return false;
    return findEdge(sa, sb) != npos || findEdge(sb, sa) != npos;
}

// ─── Traversal ─────────────────────────────────────────────────

template <typename V, typename ED, typename Hash>
void DirectedGraph<V, ED, Hash>::bfs(const V& start, bool against_flow,
                                     const VertexVisitor& visitor,
                                     const EdgeFilter& follow) const {
    bfs(std::vector<V>{start}, against_flow, visitor, follow);
}

template <typename V, typename ED, typename Hash>
void DirectedGraph<V, ED, Hash>::bfs(const std::vector<V>& starts, bool against_flow,
                                     const VertexVisitor& visitor,
                                     const EdgeFilter& follow) const {
    std::vector<char> visited(vertices_.size(), 0);
    std::deque<size_t> queue;

    for (const V& start : starts) {
        size_t slot = slotOf(start);
        if (visited[slot]) continue;
        visited[slot] = 1;
        if (!visitor(vertices_[slot].vertex)) return;
        queue.push_back(slot);
    }

    while (!queue.empty()) {
        size_t current = queue.front();
        queue.pop_front();

        const VertexRecord& rec = vertices_[current];
        const auto& edge_list = against_flow ? rec.in_edges : rec.out_edges;
        for (size_t ei : edge_list) {
            const EdgeRecord& e = edges_[ei];
            if (follow && !follow(e.edge)) continue;

            size_t next = against_flow ? e.source_slot : e.dest_slot;
            if (visited[next]) continue;
            visited[next] = 1;
            if (!visitor(vertices_[next].vertex)) return;
            queue.push_back(next);
        }
    }
}

template <typename V, typename ED, typename Hash>
bool DirectedGraph<V, ED, Hash>::existsPath(const V& source, const V& dest) const {
    // Walk from dest against the edge direction until source shows up
    bool found = false;
    bfs(dest, true, [&](const V& vertex) {
        if (!(vertex == source)) return true;
        found = true;
        return false;
    });
    return found;
}

template <typename V, typename ED, typename Hash>
size_t DirectedGraph<V, ED, Hash>::getNumberOfPaths(const V& source, const V& dest) const {
    size_t s = slotOf(source);
    size_t d = slotOf(dest);
    std::vector<size_t> memo(vertices_.size(), npos);
    std::vector<char> on_stack(vertices_.size(), 0);
    return countPaths(s, d, memo, on_stack);
}

template <typename V, typename ED, typename Hash>
size_t DirectedGraph<V, ED, Hash>::countPaths(size_t slot, size_t dest_slot,
                                              std::vector<size_t>& memo,
                                              std::vector<char>& on_stack) const {
    if (slot == dest_slot) return 1;
    if (memo[slot] != npos) return memo[slot];
    if (on_stack[slot])
        throw std::runtime_error("Cycle through " + detail::describeVertex(vertices_[slot].vertex) +
                                 " while counting paths");

    on_stack[slot] = 1;
    size_t paths = 0;
    for (size_t ei : vertices_[slot].out_edges)
        paths += countPaths(edges_[ei].dest_slot, dest_slot, memo, on_stack);
    on_stack[slot] = 0;

    memo[slot] = paths;
    return paths;
}

template <typename V, typename ED, typename Hash>
typename DirectedGraph<V, ED, Hash>::VertexSet
DirectedGraph<V, ED, Hash>::getVerticesOfUpperInducedGraph(const std::optional<V>& root,
                                                           const V& vertex) const {
    VertexSet result;
    bfs(vertex, true, [&](const V& v) {
        if (!root || v == *root || existsPath(*root, v)) result.insert(v);
        return true;
    });
    return result;
}

template <typename V, typename ED, typename Hash>
std::vector<V> DirectedGraph<V, ED, Hash>::topologicalOrder() const {
    std::vector<size_t> pending(vertices_.size(), 0);
    std::deque<size_t> ready;
    for (size_t slot = 0; slot < vertices_.size(); slot++) {
        if (!vertices_[slot].alive) continue;
        pending[slot] = vertices_[slot].in_edges.size();
        if (pending[slot] == 0) ready.push_back(slot);
    }

    std::vector<V> order;
    order.reserve(index_.size());
    while (!ready.empty()) {
        size_t slot = ready.front();
        ready.pop_front();
        order.push_back(vertices_[slot].vertex);
        for (size_t ei : vertices_[slot].out_edges) {
            size_t next = edges_[ei].dest_slot;
            if (--pending[next] == 0) ready.push_back(next);
        }
    }

    if (order.size() != index_.size())
        throw std::runtime_error("Graph contains a cycle; no topological order exists");
    return order;
}

// ─── Weighted paths ────────────────────────────────────────────

template <typename V, typename ED, typename Hash>
int DirectedGraph<V, ED, Hash>::weightOf(const EdgeType& edge, const EdgeWeighter& weighter) const {
    return weighter ? weighter(edge.source, edge.dest, edge.data) : 1;
}

template <typename V, typename ED, typename Hash>
std::vector<V> DirectedGraph<V, ED, Hash>::pathTo(size_t slot,
                                                  const std::vector<size_t>& parent) const {
    std::vector<V> path;
    for (size_t cur = slot; cur != npos; cur = parent[cur]) {
        path.push_back(vertices_[cur].vertex);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

template <typename V, typename ED, typename Hash>
void DirectedGraph<V, ED, Hash>::singleSourceShortestPath(const V& source, bool against_flow,
                                                          const DistanceVisitor& visitor,
                                                          const EdgeWeighter& weighter) const {
    size_t src = slotOf(source);
    size_t n = vertices_.size();

    std::vector<int> distance(n, 0);
    std::vector<size_t> parent(n, npos);
    std::vector<char> reached(n, 0);
    std::vector<char> settled(n, 0);
    std::vector<size_t> order;

    using QueueEntry = std::pair<int, size_t>;
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, std::greater<QueueEntry>> queue;

    reached[src] = 1;
    queue.push({0, src});

    while (!queue.empty()) {
        auto [dist, u] = queue.top();
        queue.pop();
        if (settled[u]) continue;  // stale entry
        settled[u] = 1;
        order.push_back(u);

        const auto& edge_list = against_flow ? vertices_[u].in_edges : vertices_[u].out_edges;
        for (size_t ei : edge_list) {
            const EdgeRecord& e = edges_[ei];
            size_t next = against_flow ? e.source_slot : e.dest_slot;
            int candidate = dist + weightOf(e.edge, weighter);
            if (!reached[next] || distance[next] > candidate) {
                reached[next] = 1;
                distance[next] = candidate;
                parent[next] = u;
                queue.push({candidate, next});
            }
        }
    }

    for (size_t u : order) {
        if (!visitor(vertices_[u].vertex, pathTo(u, parent), distance[u])) return;
    }
}

template <typename V, typename ED, typename Hash>
void DirectedGraph<V, ED, Hash>::bellmanFord(const V& source, int weight_multiplier,
                                             const DistanceVisitor& visitor,
                                             const EdgeWeighter& weighter) const {
    size_t src = slotOf(source);
    size_t n = vertices_.size();

    std::vector<int> distance(n, 0);
    std::vector<size_t> parent(n, npos);
    std::vector<char> reached(n, 0);
    reached[src] = 1;

    auto relaxAll = [&]() {
        bool changed = false;
        for (size_t u = 0; u < n; u++) {
            if (!vertices_[u].alive || !reached[u]) continue;
            for (size_t ei : vertices_[u].out_edges) {
                const EdgeRecord& e = edges_[ei];
                int candidate = distance[u] + weightOf(e.edge, weighter) * weight_multiplier;
                size_t v = e.dest_slot;
                if (!reached[v] || distance[v] > candidate) {
                    reached[v] = 1;
                    distance[v] = candidate;
                    parent[v] = u;
                    changed = true;
                }
            }
        }
        return changed;
    };

    // Without a negative cycle at most |V| - 1 rounds change anything
    bool changed = false;
    for (size_t round = 0; round < index_.size(); round++) {
        changed = relaxAll();
        if (!changed) break;
    }
    if (changed) {
        throw NegativeCycleError("Distances from " + detail::describeVertex(source) +
                                 " did not converge; the graph contains a negative cycle");
    }

    for (size_t u = 0; u < n; u++) {
        if (!vertices_[u].alive || !reached[u]) continue;
        if (!visitor(vertices_[u].vertex, pathTo(u, parent), distance[u])) return;
    }
}

template <typename V, typename ED, typename Hash>
void DirectedGraph<V, ED, Hash>::singleSourceShortestPathBF(const V& source,
                                                            const DistanceVisitor& visitor,
                                                            const EdgeWeighter& weighter) const {
    bellmanFord(source, 1, visitor, weighter);
}

template <typename V, typename ED, typename Hash>
void DirectedGraph<V, ED, Hash>::singleSourceLongestPath(const V& source,
                                                         const DistanceVisitor& visitor,
                                                         const EdgeWeighter& weighter) const {
    bellmanFord(source, -1, [&](const V& vertex, const std::vector<V>& path, int distance) {
        return visitor(vertex, path, -distance);
    }, weighter);
}

// ─── Derived graphs ────────────────────────────────────────────

template <typename V, typename ED, typename Hash>
DirectedGraph<V, ED, Hash> DirectedGraph<V, ED, Hash>::subGraph(const VertexSet& vertices,
                                                                const EdgeDataFilter& leave_out) const {
    DirectedGraph graph;
    for (const auto& rec : vertices_) {
        if (rec.alive && vertices.count(rec.vertex)) graph.addVertex(rec.vertex);
    }

    // Adding the in edges of each kept vertex covers every edge once
    for (const auto& rec : vertices_) {
        if (!rec.alive || !vertices.count(rec.vertex)) continue;
        for (size_t ei : rec.in_edges) {
            const EdgeType& e = edges_[ei].edge;
            if (leave_out && leave_out(e.data)) continue;
            if (vertices.count(e.source)) graph.addEdge(e.source, e.dest, e.data);
        }
    }
    return graph;
}

template <typename V, typename ED, typename Hash>
DirectedGraph<V, ED, Hash>
DirectedGraph<V, ED, Hash>::transitiveClosureOfSubGraph(const VertexSet& vertices) const {
    DirectedGraph graph;
    std::vector<V> included;
    for (const auto& rec : vertices_) {
        if (rec.alive && vertices.count(rec.vertex)) {
            graph.addVertex(rec.vertex);
            included.push_back(rec.vertex);
        }
    }

    for (const V& v1 : included) {
        bfs(v1, false, [&](const V& v) {
            if (!(v == v1) && vertices.count(v)) graph.addEdge(v1, v, ED{});
            return true;
        });
    }
    return graph;
}

template <typename V, typename ED, typename Hash>
DirectedGraph<V, ED, Hash>
DirectedGraph<V, ED, Hash>::compactedSubgraph(const VertexSet& vertices,
                                              const EdgeDataMerger& merger) const {
    DirectedGraph graph = clone();
    for (const auto& rec : vertices_) {
        if (rec.alive && !vertices.count(rec.vertex))
            graph.removeVertexMaintainConnectivity(rec.vertex, merger);
    }
    return graph;
}

template <typename V, typename ED, typename Hash>
DirectedGraph<V, ED, Hash>
DirectedGraph<V, ED, Hash>::pathMaintainingSubGraph(const VertexSet& vertices,
                                                    const EdgeDataMerger& merger) const {
    DirectedGraph current = compactedSubgraph(vertices, merger);
    bool reduced;

    do {
        reduced = false;

        std::unordered_map<V, VertexSet, Hash> upper_cache;
        auto upper = [&](const V& v) -> const VertexSet& {
            auto it = upper_cache.find(v);
            if (it == upper_cache.end())
                it = upper_cache.emplace(v, current.getVerticesOfUpperInducedGraph(std::nullopt, v)).first;
            return it->second;
        };

        DirectedGraph next;
        std::vector<V> order = current.getVertices();
        for (const V& v : order) next.addVertex(v);

        for (const V& v : order) {
            std::vector<EdgeType> parents = current.getInEdges(v);
            size_t upper_size = upper(v).size();

            // Leaving out parent p shrinks the upper set of v by exactly one
            // (v itself) iff p is an ancestor of another parent, in which
            // case the edge p → v is implied by a longer path.
            for (const EdgeType& p : parents) {
                VertexSet without_p;
                for (const EdgeType& p2 : parents) {
                    if (p2.source == p.source) continue;
                    const VertexSet& up = upper(p2.source);
                    without_p.insert(up.begin(), up.end());
                }

                if (without_p.size() + 1 != upper_size) {
                    next.addEdge(p.source, v, p.data);
                } else {
                    reduced = true;
                }
            }
        }
        current = std::move(next);
    } while (reduced);

    return current;
}

template <typename V, typename ED, typename Hash>
DirectedGraph<V, ED, Hash> DirectedGraph<V, ED, Hash>::clone() const {
    DirectedGraph copy;
    for (const auto& rec : vertices_) {
        if (rec.alive) copy.addVertex(rec.vertex);
    }
    for (const auto& rec : vertices_) {
        if (!rec.alive) continue;
        for (size_t ei : rec.out_edges) {
            const EdgeType& e = edges_[ei].edge;
            copy.addEdge(e.source, e.dest, e.data);
        }
    }
    return copy;
}

// ─── Merging ───────────────────────────────────────────────────

template <typename V, typename ED, typename Hash>
void DirectedGraph<V, ED, Hash>::mergeVertices(const V& representative,
                                               const std::vector<V>& equivalents) {
    slotOf(representative);
    for (const V& eq : equivalents) {
        if (!containsVertex(eq))
            throw std::runtime_error("Vertex " + detail::describeVertex(eq) +
                                     " not contained within the graph");
    }

    VertexSet merged;
    for (const V& eq : equivalents) {
        if (eq == representative || !merged.insert(eq).second) continue;

        size_t slot = slotOf(eq);

        std::vector<std::pair<V, ED>> incoming;
        std::vector<std::pair<V, ED>> outgoing;
        for (size_t ei : vertices_[slot].in_edges)
            incoming.emplace_back(edges_[ei].edge.source, edges_[ei].edge.data);
        for (size_t ei : vertices_[slot].out_edges)
            outgoing.emplace_back(edges_[ei].edge.dest, edges_[ei].edge.data);

        removeVertex(eq);

        // Self-edges of eq vanish with it
        for (auto& [neighbour, data] : incoming) {
            if (neighbour == representative || neighbour == eq) continue;
            if (hasEdge(neighbour, representative)) continue;
            addEdge(neighbour, representative, std::move(data));
        }
        for (auto& [neighbour, data] : outgoing) {
            if (neighbour == representative || neighbour == eq) continue;
            if (hasEdge(representative, neighbour)) continue;
            addEdge(representative, neighbour, std::move(data));
        }
    }
}

} // namespace ontograph
