#include <gtest/gtest.h>

#include "strata/core/LayoutGraph.h"

// Internal headers
#include "../../../src/layout/sugiyama/CycleRemoval.h"
#include "../../../src/layout/sugiyama/GreedyCycleRemoval.h"

using namespace strata;
using namespace strata::algorithms;

namespace {

LayoutGraph makeGraph(const std::vector<std::string>& nodes,
                      const std::vector<std::pair<std::string, std::string>>& edges) {
    LayoutGraph g(GraphOptions{true, true, false});
    for (const auto& v : nodes) {
        g.setNode(v);
    }
    for (const auto& [v, w] : edges) {
        g.setEdge(v, w);
    }
    return g;
}

}  // namespace

// =============================================================================
// DFS Tests
// =============================================================================

TEST(CycleRemovalTest, Dfs_AcyclicGraphNeedsNothing) {
    LayoutGraph g = makeGraph({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}, {"a", "c"}});
    CycleRemoval dfs;

    auto result = dfs.findEdgesToReverse(g);

    EXPECT_TRUE(result.isAcyclic);
    EXPECT_TRUE(result.reversedEdges.empty());
    EXPECT_FALSE(dfs.hasCycles(g));
}

TEST(CycleRemovalTest, Dfs_ReversesBackEdgeOfTriangle) {
    LayoutGraph g = makeGraph({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}, {"c", "a"}});
    CycleRemoval dfs;

    auto result = dfs.findEdgesToReverse(g);

    ASSERT_EQ(result.reversedEdges.size(), 1u);
    EXPECT_EQ(result.reversedEdges[0], (EdgeKey{"c", "a"}));
    EXPECT_TRUE(dfs.hasCycles(g));
}

TEST(CycleRemovalTest, Dfs_IgnoresSelfLoops) {
    LayoutGraph g = makeGraph({"a", "b"}, {{"a", "a"}, {"a", "b"}});
    CycleRemoval dfs;

    EXPECT_TRUE(dfs.findEdgesToReverse(g).isAcyclic);
}

TEST(CycleRemovalTest, Dfs_StartsFromFirstNodeInInsertionOrder) {
    LayoutGraph g = makeGraph({"b", "a"}, {{"a", "b"}, {"b", "a"}});
    CycleRemoval dfs;

    auto result = dfs.findEdgesToReverse(g);

    ASSERT_EQ(result.reversedEdges.size(), 1u);
    EXPECT_EQ(result.reversedEdges[0], (EdgeKey{"a", "b"}));
}

// =============================================================================
// Greedy Tests
// =============================================================================

TEST(GreedyCycleRemovalTest, AcyclicGraphNeedsNothing) {
    LayoutGraph g = makeGraph({"a", "b", "c", "d"},
                              {{"a", "b"}, {"b", "c"}, {"a", "d"}, {"d", "c"}});
    GreedyCycleRemoval greedy;

    EXPECT_TRUE(greedy.findEdgesToReverse(g).isAcyclic);
    EXPECT_FALSE(greedy.hasCycles(g));
}

TEST(GreedyCycleRemovalTest, BreaksTwoCycle) {
    LayoutGraph g = makeGraph({"a", "b"}, {{"a", "b"}, {"b", "a"}});
    GreedyCycleRemoval greedy;

    auto result = greedy.findEdgesToReverse(g);

    ASSERT_EQ(result.reversedEdges.size(), 1u);
    EXPECT_EQ(result.reversedEdges[0], (EdgeKey{"b", "a"}));
}

TEST(GreedyCycleRemovalTest, PrefersLightEdges) {
    LayoutGraph g = makeGraph({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}});
    EdgeLabel light;
    light.weight = 1;
    EdgeLabel heavy;
    heavy.weight = 5;
    g.setEdge("a", "b", heavy);
    g.setEdge("b", "c", heavy);
    g.setEdge("c", "a", light);

    auto result = GreedyCycleRemoval().findEdgesToReverse(g);

    ASSERT_EQ(result.reversedEdges.size(), 1u);
    EXPECT_EQ(result.reversedEdges[0], (EdgeKey{"c", "a"}));
}

TEST(GreedyCycleRemovalTest, ReturnsEveryParallelEdgeOfSelectedPair) {
    LayoutGraph g = makeGraph({"a", "b"}, {});
    g.setEdge("a", "b", EdgeLabel{}, "x");
    g.setEdge("a", "b", EdgeLabel{}, "y");
    EdgeLabel heavy;
    heavy.weight = 3;
    g.setEdge("b", "a", heavy);

    auto result = GreedyCycleRemoval().findEdgesToReverse(g);

    ASSERT_EQ(result.reversedEdges.size(), 2u);
    EXPECT_EQ(result.reversedEdges[0], (EdgeKey{"a", "b", "x"}));
    EXPECT_EQ(result.reversedEdges[1], (EdgeKey{"a", "b", "y"}));

    Acyclic::run(g, GreedyCycleRemoval());
    EXPECT_FALSE(CycleRemoval().hasCycles(g));
    EXPECT_TRUE(g.hasEdge("b", "a"));
}

// =============================================================================
// Acyclic Tests
// =============================================================================

TEST(AcyclicTest, Run_RenamesReversedEdges) {
    LayoutGraph g = makeGraph({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}});
    EdgeLabel label;
    label.weight = 3;
    g.setEdge("c", "a", label, "back");

    size_t reversed = Acyclic::run(g, CycleRemoval());

    EXPECT_EQ(reversed, 1u);
    EXPECT_FALSE(g.hasEdge("c", "a", "back"));
    ASSERT_TRUE(g.hasEdge("a", "c", "rev1"));
    const EdgeLabel& flipped = g.edge("a", "c", "rev1");
    EXPECT_TRUE(flipped.reversed);
    EXPECT_EQ(flipped.forwardName, "back");
    EXPECT_DOUBLE_EQ(flipped.weight, 3.0);
    EXPECT_FALSE(CycleRemoval().hasCycles(g));
}

TEST(AcyclicTest, Undo_RestoresNameDirectionAndPointOrder) {
    LayoutGraph g = makeGraph({"a", "b"}, {{"a", "b"}});
    g.setEdge("b", "a", EdgeLabel{}, "back");
    Acyclic::run(g, CycleRemoval());

    g.edge("a", "b", "rev1").points = {{0, 0}, {1, 1}, {2, 2}};
    Acyclic::undo(g);

    ASSERT_TRUE(g.hasEdge("b", "a", "back"));
    EXPECT_FALSE(g.hasEdge("a", "b", "rev1"));
    const EdgeLabel& restored = g.edge("b", "a", "back");
    EXPECT_FALSE(restored.reversed);
    EXPECT_FALSE(restored.forwardName.has_value());
    ASSERT_EQ(restored.points.size(), 3u);
    EXPECT_EQ(restored.points.front(), (Point{2, 2}));
    EXPECT_EQ(restored.points.back(), (Point{0, 0}));
}

TEST(AcyclicTest, Run_SelfLoopsStay) {
    LayoutGraph g = makeGraph({"a"}, {{"a", "a"}});

    EXPECT_EQ(Acyclic::run(g, GreedyCycleRemoval()), 0u);
    EXPECT_TRUE(g.hasEdge("a", "a"));
}
