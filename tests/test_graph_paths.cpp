#include <gtest/gtest.h>
#include "graph/directed_graph.hpp"

#include <map>
#include <string>

using namespace ontograph;

using WeightedGraph = DirectedGraph<std::string, int>;

namespace {

struct Reached {
    int distance;
    std::vector<std::string> path;
};

// s -4-> a -1-> t, s -1-> b -1-> a, b -5-> t
WeightedGraph weighted() {
    WeightedGraph g;
    for (const char* v : {"s", "a", "b", "t"}) g.addVertex(v);
    g.addEdge("s", "a", 4);
    g.addEdge("a", "t", 1);
    g.addEdge("s", "b", 1);
    g.addEdge("b", "a", 1);
    g.addEdge("b", "t", 5);
    return g;
}

int byPayload(const std::string&, const std::string&, const int& w) { return w; }

} // namespace

// ─── Dijkstra ──────────────────────────────────────────────────

TEST(GraphPathTest, DijkstraUsesWeights) {
    WeightedGraph g = weighted();
    std::map<std::string, Reached> reached;
    g.singleSourceShortestPath("s", false,
        [&](const std::string& v, const std::vector<std::string>& path, int d) {
            reached[v] = Reached{d, path};
            return true;
        }, byPayload);

    ASSERT_EQ(reached.size(), 4u);
    EXPECT_EQ(reached["s"].distance, 0);
    EXPECT_EQ(reached["b"].distance, 1);
    EXPECT_EQ(reached["a"].distance, 2);
    EXPECT_EQ(reached["t"].distance, 3);
    EXPECT_EQ(reached["t"].path, (std::vector<std::string>{"s", "b", "a", "t"}));
}

TEST(GraphPathTest, DijkstraDefaultsToUnitWeights) {
    WeightedGraph g = weighted();
    std::map<std::string, int> distance;
    g.singleSourceShortestPath("s", false,
        [&](const std::string& v, const std::vector<std::string>&, int d) {
            distance[v] = d;
            return true;
        });
    EXPECT_EQ(distance["a"], 1);
    EXPECT_EQ(distance["t"], 2);
}

TEST(GraphPathTest, DijkstraAgainstFlow) {
    WeightedGraph g = weighted();
    std::map<std::string, int> distance;
    g.singleSourceShortestPath("t", true,
        [&](const std::string& v, const std::vector<std::string>&, int d) {
            distance[v] = d;
            return true;
        }, byPayload);
    EXPECT_EQ(distance["a"], 1);
    EXPECT_EQ(distance["b"], 2);
    EXPECT_EQ(distance["s"], 3);
}

TEST(GraphPathTest, DijkstraReportsInDistanceOrderAndAborts) {
    WeightedGraph g = weighted();
    std::vector<std::string> order;
    g.singleSourceShortestPath("s", false,
        [&](const std::string& v, const std::vector<std::string>&, int) {
            order.push_back(v);
            return order.size() < 2;
        }, byPayload);
    EXPECT_EQ(order, (std::vector<std::string>{"s", "b"}));
}

TEST(GraphPathTest, DijkstraSkipsUnreachable) {
    WeightedGraph g = weighted();
    g.addVertex("island");
    bool seen = false;
    g.singleSourceShortestPath("s", false,
        [&](const std::string& v, const std::vector<std::string>&, int) {
            seen = seen || v == "island";
            return true;
        });
    EXPECT_FALSE(seen);
    EXPECT_THROW(g.singleSourceShortestPath("nowhere", false,
                     [](const std::string&, const std::vector<std::string>&, int) { return true; }),
                 std::runtime_error);
}

// ─── Bellman-Ford ──────────────────────────────────────────────

TEST(GraphPathTest, BellmanFordMatchesDijkstra) {
    WeightedGraph g = weighted();
    std::map<std::string, int> distance;
    g.singleSourceShortestPathBF("s",
        [&](const std::string& v, const std::vector<std::string>&, int d) {
            distance[v] = d;
            return true;
        }, byPayload);
    EXPECT_EQ(distance["a"], 2);
    EXPECT_EQ(distance["t"], 3);
}

TEST(GraphPathTest, LongestPath) {
    WeightedGraph g = weighted();
    std::map<std::string, Reached> reached;
    g.singleSourceLongestPath("s",
        [&](const std::string& v, const std::vector<std::string>& path, int d) {
            reached[v] = Reached{d, path};
            return true;
        });
    // Unit weights: s → b → a → t is the longest route
    EXPECT_EQ(reached["s"].distance, 0);
    EXPECT_EQ(reached["b"].distance, 1);
    EXPECT_EQ(reached["a"].distance, 2);
    EXPECT_EQ(reached["t"].distance, 3);
    EXPECT_EQ(reached["t"].path, (std::vector<std::string>{"s", "b", "a", "t"}));
}

TEST(GraphPathTest, LongestPathWithWeights) {
    WeightedGraph g = weighted();
    std::map<std::string, int> distance;
    g.singleSourceLongestPath("s",
        [&](const std::string& v, const std::vector<std::string>&, int d) {
            distance[v] = d;
            return true;
        }, byPayload);
    EXPECT_EQ(distance["a"], 4);
    EXPECT_EQ(distance["t"], 6);
}

TEST(GraphPathTest, BellmanFordDetectsNegativeCycle) {
    WeightedGraph g;
    for (const char* v : {"x", "y", "z"}) g.addVertex(v);
    g.addEdge("x", "y", 1);
    g.addEdge("y", "z", 1);
    g.addEdge("z", "y", 1);

    auto ignore = [](const std::string&, const std::vector<std::string>&, int) { return true; };
    // Any cycle is positive, hence a negative cycle for the longest path
    EXPECT_THROW(g.singleSourceLongestPath("x", ignore), NegativeCycleError);
    EXPECT_NO_THROW(g.singleSourceShortestPathBF("x", ignore));
}
