#pragma once

#include <utility>

namespace ontograph {

/// A directed edge of a DirectedGraph.
/// Connects source → dest and carries an arbitrary payload (e.g. a relation).
template <typename V, typename ED>
struct Edge {
    V source;
    V dest;
    ED data{};

    Edge() = default;
    Edge(V source, V dest, ED data)
        : source(std::move(source)), dest(std::move(dest)), data(std::move(data)) {}
};

} // namespace ontograph
