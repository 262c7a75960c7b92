#include <gtest/gtest.h>

#include "strata/core/LayoutGraph.h"
#include "strata/layout/ICoordinateAssignment.h"
#include "strata/layout/Layout.h"
#include "strata/layout/SugiyamaLayout.h"
#include "strata/layout/util/LayoutUtils.h"

using namespace strata;

namespace {

LayoutGraph makeGraph(bool compound = false) {
    return LayoutGraph(GraphOptions{true, true, compound});
}

Rect boxOf(const LayoutGraph& g, const std::string& v) {
    return LayoutUtils::nodeBox(g.node(v));
}

bool containsBox(const Rect& outer, const Rect& inner) {
    constexpr double eps = 1e-6;
    return inner.left() >= outer.left() - eps && inner.right() <= outer.right() + eps &&
           inner.top() >= outer.top() - eps && inner.bottom() <= outer.bottom() + eps;
}

/// Places each rank on its own row, ordered nodes 100 apart
class GridCoordinateAssignment : public ICoordinateAssignment {
public:
    mutable int calls = 0;

    CoordinateAssignmentResult assign(LayoutGraph& graph) const override {
        ++calls;
        CoordinateAssignmentResult result;
        for (const auto& v : graph.nodes()) {
            if (graph.hasChildren(v)) {
                continue;
            }
            NodeLabel& node = graph.node(v);
            double x = node.order.value_or(0) * 100.0;
            node.x = x;
            node.y = node.rank.value_or(0) * 100.0;
            result.xs[v] = x;
        }
        return result;
    }

    const char* algorithmName() const override { return "grid"; }
};

}  // namespace

// =============================================================================
// Basic Layout Tests
// =============================================================================

TEST(SugiyamaLayoutTest, EmptyGraph_DoesNothing) {
    LayoutGraph g = makeGraph();
    SugiyamaLayout layout;

    EXPECT_NO_THROW(layout.layoutDagreish(g));
    EXPECT_EQ(g.nodeCount(), 0u);
    EXPECT_EQ(layout.lastStats().rankCount, 0);
}

TEST(SugiyamaLayoutTest, SingleNode_PlacedAtMargin) {
    LayoutGraph g = makeGraph();
    g.setNode("a", NodeLabel(50, 100));

    layoutDagreish(g);

    EXPECT_DOUBLE_EQ(*g.node("a").x, 25.0);
    EXPECT_DOUBLE_EQ(*g.node("a").y, 50.0);
    EXPECT_EQ(g.node("a").rank, 0);
    EXPECT_EQ(g.node("a").order, 0);
}

TEST(SugiyamaLayoutTest, SingleNode_HonoursMargins) {
    LayoutGraph g = makeGraph();
    g.graph().marginx = 10;
    g.graph().marginy = 20;
    g.setNode("a", NodeLabel(50, 100));

    layoutDagreish(g);

    EXPECT_DOUBLE_EQ(*g.node("a").x, 35.0);
    EXPECT_DOUBLE_EQ(*g.node("a").y, 70.0);
}

TEST(SugiyamaLayoutTest, SameRank_SeparatedByNodesep) {
    LayoutGraph g = makeGraph();
    g.graph().nodesep = 200;
    g.setNode("a", NodeLabel(50, 100));
    g.setNode("b", NodeLabel(75, 200));

    layoutDagreish(g);

    EXPECT_DOUBLE_EQ(*g.node("a").x, 25.0);
    EXPECT_DOUBLE_EQ(*g.node("b").x, 50.0 + 200.0 + 75.0 / 2);
    EXPECT_DOUBLE_EQ(*g.node("a").y, 100.0);
    EXPECT_DOUBLE_EQ(*g.node("b").y, 100.0);
}

TEST(SugiyamaLayoutTest, Edge_StacksRanksByRanksep) {
    LayoutGraph g = makeGraph();
    g.graph().ranksep = 300;
    g.setNode("a", NodeLabel(50, 100));
    g.setNode("b", NodeLabel(75, 200));
    g.setEdge("a", "b");

    layoutDagreish(g);

    EXPECT_DOUBLE_EQ(*g.node("a").x, 75.0 / 2);
    EXPECT_DOUBLE_EQ(*g.node("a").y, 50.0);
    EXPECT_DOUBLE_EQ(*g.node("b").x, 75.0 / 2);
    EXPECT_DOUBLE_EQ(*g.node("b").y, 100.0 + 300.0 + 100.0);
    EXPECT_EQ(g.node("a").rank, 0);
    EXPECT_EQ(g.node("b").rank, 2);
}

TEST(SugiyamaLayoutTest, Edge_PointsClippedToNodeBoxes) {
    LayoutGraph g = makeGraph();
    g.graph().ranksep = 300;
    g.setNode("a", NodeLabel(50, 100));
    g.setNode("b", NodeLabel(75, 200));
    g.setEdge("a", "b");

    layoutDagreish(g);

    const auto& points = g.edge("a", "b").points;
    ASSERT_EQ(points.size(), 3u);
    EXPECT_DOUBLE_EQ(points[0].x, 37.5);
    EXPECT_DOUBLE_EQ(points[0].y, 100.0);
    EXPECT_DOUBLE_EQ(points[1].y, 250.0);
    EXPECT_DOUBLE_EQ(points[2].x, 37.5);
    EXPECT_DOUBLE_EQ(points[2].y, 400.0);
    EXPECT_FALSE(g.edge("a", "b").x.has_value());
}

TEST(SugiyamaLayoutTest, EdgeLabel_GetsOwnRank) {
    LayoutGraph g = makeGraph();
    g.graph().ranksep = 300;
    g.setNode("a", NodeLabel(50, 100));
    g.setNode("b", NodeLabel(75, 200));
    EdgeLabel label;
    label.width = 60;
    label.height = 70;
    label.labelpos = LabelPos::C;
    g.setEdge("a", "b", label);

    layoutDagreish(g);

    EXPECT_DOUBLE_EQ(*g.node("a").y, 50.0);
    EXPECT_DOUBLE_EQ(*g.node("b").y, 100.0 + 150.0 + 70.0 + 150.0 + 100.0);
    const EdgeLabel& edge = g.edge("a", "b");
    ASSERT_TRUE(edge.x.has_value());
    EXPECT_DOUBLE_EQ(*edge.x, 37.5);
    EXPECT_DOUBLE_EQ(*edge.y, 100.0 + 150.0 + 35.0);
}

TEST(SugiyamaLayoutTest, LongEdge_ThroughDummyPoints) {
    LayoutGraph g = makeGraph();
    for (const char* v : {"a", "b", "c"}) {
        g.setNode(v, NodeLabel(20, 20));
    }
    g.setEdge("a", "b");
    g.setEdge("b", "c");
    g.setEdge("a", "c");

    layoutDagreish(g);

    // Two ranks per unit edge: a 0, b 2, c 4; a -> c passes three dummies
    EXPECT_EQ(g.edge("a", "c").points.size(), 5u);
    EXPECT_EQ(g.edge("a", "b").points.size(), 3u);
    EXPECT_EQ(g.node("c").rank, 4);
}

// =============================================================================
// Ordering Tests
// =============================================================================

TEST(SugiyamaLayoutTest, Bowtie_Uncrossed) {
    LayoutGraph g = makeGraph();
    for (const char* v : {"a", "b", "c", "d"}) {
        g.setNode(v, NodeLabel(30, 30));
    }
    g.setEdge("a", "d");
    g.setEdge("b", "c");

    SugiyamaLayout layout;
    layout.layoutDagreish(g);

    EXPECT_DOUBLE_EQ(layout.lastStats().crossings, 0.0);
    bool aLeft = *g.node("a").x < *g.node("b").x;
    bool dLeft = *g.node("d").x < *g.node("c").x;
    EXPECT_EQ(aLeft, dLeft);
}

TEST(SugiyamaLayoutTest, CompleteBipartite_OneUnavoidableCrossing) {
    LayoutGraph g = makeGraph();
    for (const char* v : {"a", "b", "c", "d"}) {
        g.setNode(v, NodeLabel(30, 30));
    }
    g.setEdge("a", "c");
    g.setEdge("a", "d");
    g.setEdge("b", "c");
    g.setEdge("b", "d");

    SugiyamaLayout layout;
    layout.layoutDagreish(g);

    EXPECT_DOUBLE_EQ(layout.lastStats().crossings, 1.0);
    EXPECT_EQ(g.node("a").rank, g.node("b").rank);
    EXPECT_EQ(g.node("c").rank, g.node("d").rank);
}

TEST(SugiyamaLayoutTest, RankOrder_NoOverlap) {
    LayoutGraph g = makeGraph();
    for (const char* v : {"r", "a", "b", "c", "d", "e"}) {
        g.setNode(v, NodeLabel(40, 20));
    }
    for (const char* v : {"a", "b", "c"}) {
        g.setEdge("r", v);
    }
    g.setEdge("a", "e");
    g.setEdge("c", "d");
    g.setEdge("b", "d");

    layoutDagreish(g);

    Layering layering = LayoutUtils::buildLayerMatrix(g);
    for (const auto& layer : layering) {
        for (size_t i = 1; i < layer.size(); ++i) {
            const NodeLabel& left = g.node(layer[i - 1]);
            const NodeLabel& right = g.node(layer[i]);
            EXPECT_LE(*left.x + left.width / 2 + g.graph().nodesep, *right.x - right.width / 2 + 1e-9);
        }
    }
}

// =============================================================================
// Compound Tests
// =============================================================================

TEST(SugiyamaLayoutTest, Compound_BoxContainsChildren) {
    LayoutGraph g = makeGraph(true);
    g.setNode("a", NodeLabel(50, 40));
    g.setNode("b", NodeLabel(60, 30));
    g.setNode("c", NodeLabel(20, 20));
    g.setParent("a", "sg");
    g.setParent("b", "sg");
    g.setEdge("a", "b");
    g.setEdge("c", "a");

    layoutDagreish(g);

    const NodeLabel& sg = g.node("sg");
    ASSERT_TRUE(sg.x.has_value());
    ASSERT_TRUE(sg.y.has_value());
    EXPECT_GT(sg.width, 0.0);
    EXPECT_GT(sg.height, 0.0);
    EXPECT_TRUE(containsBox(boxOf(g, "sg"), boxOf(g, "a")));
    EXPECT_TRUE(containsBox(boxOf(g, "sg"), boxOf(g, "b")));
    EXPECT_FALSE(containsBox(boxOf(g, "sg"), boxOf(g, "c")));
    ASSERT_TRUE(sg.minRank.has_value());
    EXPECT_LE(*sg.minRank, *g.node("a").rank);
    EXPECT_GE(*sg.maxRank, *g.node("b").rank);
}

TEST(SugiyamaLayoutTest, Compound_SpanBoundsMembers) {
    LayoutGraph g = makeGraph(true);
    for (const char* v : {"x", "y", "z"}) {
        g.setNode(v, NodeLabel(30, 30));
    }
    g.setParent("x", "s");
    g.setParent("y", "s");
    g.setEdge("x", "z");

    layoutDagreish(g);

    const NodeLabel& s = g.node("s");
    ASSERT_TRUE(s.minRank.has_value());
    ASSERT_TRUE(s.maxRank.has_value());
    for (const char* v : {"x", "y"}) {
        EXPECT_LE(*s.minRank, *g.node(v).rank) << v;
        EXPECT_GE(*s.maxRank, *g.node(v).rank) << v;
    }
    EXPECT_GT(*g.node("z").rank, *g.node("x").rank);
}

TEST(SugiyamaLayoutTest, Compound_NestedBoxes) {
    LayoutGraph g = makeGraph(true);
    g.setNode("a", NodeLabel(30, 30));
    g.setNode("b", NodeLabel(30, 30));
    g.setParent("a", "inner");
    g.setParent("inner", "outer");
    g.setParent("b", "outer");
    g.setEdge("a", "b");

    layoutDagreish(g);

    EXPECT_TRUE(containsBox(boxOf(g, "outer"), boxOf(g, "inner")));
    EXPECT_TRUE(containsBox(boxOf(g, "inner"), boxOf(g, "a")));
    EXPECT_TRUE(containsBox(boxOf(g, "outer"), boxOf(g, "b")));
}

TEST(SugiyamaLayoutTest, Compound_LeavesStructureIntact) {
    LayoutGraph g = makeGraph(true);
    g.setNode("a", NodeLabel(30, 30));
    g.setParent("a", "sg");
    g.setNode("b", NodeLabel(30, 30));
    g.setEdge("a", "b");

    layoutDagreish(g);

    EXPECT_EQ(g.nodeCount(), 3u);
    EXPECT_EQ(g.edgeCount(), 1u);
    EXPECT_EQ(g.parent("a"), "sg");
}

// =============================================================================
// Determinism Tests
// =============================================================================

TEST(SugiyamaLayoutTest, SameInput_SameOutput) {
    auto build = [] {
        LayoutGraph g = makeGraph();
        for (const char* v : {"a", "b", "c", "d", "e"}) {
            g.setNode(v, NodeLabel(30, 20));
        }
        g.setEdge("a", "b");
        g.setEdge("a", "c");
        g.setEdge("b", "d");
        g.setEdge("c", "d");
        g.setEdge("e", "c");
        return g;
    };
    LayoutGraph first = build();
    LayoutGraph second = build();

    layoutDagreish(first);
    layoutDagreish(second);

    for (const auto& v : first.nodes()) {
        EXPECT_DOUBLE_EQ(*first.node(v).x, *second.node(v).x) << v;
        EXPECT_DOUBLE_EQ(*first.node(v).y, *second.node(v).y) << v;
    }
}

TEST(SugiyamaLayoutTest, Relayout_IsStable) {
    LayoutGraph g = makeGraph();
    for (const char* v : {"a", "b", "c"}) {
        g.setNode(v, NodeLabel(30, 20));
    }
    g.setEdge("a", "b");
    g.setEdge("a", "c");

    layoutDagreish(g);
    std::vector<double> xs;
    for (const auto& v : g.nodes()) {
        xs.push_back(*g.node(v).x);
    }
    layoutDagreish(g);

    size_t i = 0;
    for (const auto& v : g.nodes()) {
        EXPECT_DOUBLE_EQ(*g.node(v).x, xs[i++]) << v;
    }
}

// =============================================================================
// Direction Tests
// =============================================================================

TEST(SugiyamaLayoutTest, RankDir_LeftToRight) {
    LayoutGraph g = makeGraph();
    g.graph().rankdir = Direction::LeftToRight;
    g.setNode("a", NodeLabel(50, 20));
    g.setNode("b", NodeLabel(50, 20));
    g.setEdge("a", "b");

    layoutDagreish(g);

    EXPECT_LT(*g.node("a").x, *g.node("b").x);
    EXPECT_DOUBLE_EQ(*g.node("a").y, *g.node("b").y);
    // Nodes keep their width along the rank axis
    EXPECT_DOUBLE_EQ(*g.node("a").x, 25.0);
}

TEST(SugiyamaLayoutTest, RankDir_BottomToTop) {
    LayoutGraph g = makeGraph();
    g.graph().rankdir = Direction::BottomToTop;
    g.setNode("a", NodeLabel(50, 20));
    g.setNode("b", NodeLabel(50, 20));
    g.setEdge("a", "b");

    layoutDagreish(g);

    EXPECT_GT(*g.node("a").y, *g.node("b").y);
    EXPECT_DOUBLE_EQ(*g.node("a").x, *g.node("b").x);
    EXPECT_DOUBLE_EQ(*g.node("b").y, 10.0);
}

TEST(SugiyamaLayoutTest, RankDir_RightToLeft) {
    LayoutGraph g = makeGraph();
    g.graph().rankdir = Direction::RightToLeft;
    g.setNode("a", NodeLabel(50, 20));
    g.setNode("b", NodeLabel(50, 20));
    g.setEdge("a", "b");

    layoutDagreish(g);

    EXPECT_GT(*g.node("a").x, *g.node("b").x);
    EXPECT_DOUBLE_EQ(*g.node("a").y, *g.node("b").y);
}

// =============================================================================
// Edge Cases
// =============================================================================

TEST(SugiyamaLayoutTest, SelfLoop_RoutedRightOfNode) {
    LayoutGraph g = makeGraph();
    g.setNode("a", NodeLabel(50, 50));
    g.setEdge("a", "a");

    layoutDagreish(g);

    const auto& points = g.edge("a", "a").points;
    ASSERT_EQ(points.size(), 7u);
    for (const auto& p : points) {
        EXPECT_GE(p.x, *g.node("a").x);
    }
}

TEST(SugiyamaLayoutTest, Cycle_ReversedEdgeKeepsDirection) {
    LayoutGraph g = makeGraph();
    g.setNode("a", NodeLabel(20, 20));
    g.setNode("b", NodeLabel(20, 20));
    g.setEdge("a", "b");
    g.setEdge("b", "a", EdgeLabel{}, "back");

    SugiyamaLayout layout;
    layout.layoutDagreish(g);

    EXPECT_EQ(layout.lastStats().reversedEdges, 1u);
    ASSERT_TRUE(g.hasEdge("b", "a", "back"));
    EXPECT_FALSE(g.hasEdge("a", "b", "back"));
    const auto& points = g.edge("b", "a", "back").points;
    ASSERT_FALSE(points.empty());
    EXPECT_LT(*g.node("a").y, *g.node("b").y);
    EXPECT_GT(points.front().y, points.back().y);
}

TEST(SugiyamaLayoutTest, Stats_ChainCounts) {
    LayoutGraph g = makeGraph();
    for (const char* v : {"a", "b", "c"}) {
        g.setNode(v, NodeLabel(20, 20));
    }
    g.setEdge("a", "b");
    g.setEdge("b", "c");

    SugiyamaLayout layout;
    layout.layoutDagreish(g);

    const auto& stats = layout.lastStats();
    EXPECT_EQ(stats.rankCount, 5);
    EXPECT_EQ(stats.dummyCount, 2u);
    EXPECT_EQ(stats.reversedEdges, 0u);
    EXPECT_DOUBLE_EQ(stats.crossings, 0.0);
    EXPECT_GT(stats.sweeps, 0);
}

TEST(SugiyamaLayoutTest, Injection_CustomCoordinateAssignment) {
    LayoutGraph g = makeGraph();
    g.setNode("a", NodeLabel(20, 20));
    g.setNode("b", NodeLabel(20, 20));
    g.setEdge("a", "b");

    auto grid = std::make_shared<GridCoordinateAssignment>();
    SugiyamaLayout layout;
    layout.setCoordinateAssignment(grid);
    layout.layoutDagreish(g);

    EXPECT_EQ(grid->calls, 1);
    EXPECT_DOUBLE_EQ(*g.node("a").x, *g.node("b").x);
    EXPECT_DOUBLE_EQ(*g.node("b").y - *g.node("a").y, 200.0);
}

// =============================================================================
// Conservative Pipeline Tests
// =============================================================================

TEST(SugiyamaLayoutTest, Conservative_StatsAndRanks) {
    LayoutGraph g = makeGraph();
    g.setNode("a", NodeLabel(20, 20));
    g.setNode("b", NodeLabel(20, 20));
    g.setEdge("a", "b");

    SugiyamaLayout layout;
    layout.layoutConservative(g);

    EXPECT_EQ(layout.lastStats().rankCount, 2);
    EXPECT_EQ(layout.lastStats().dummyCount, 0u);
    EXPECT_EQ(g.node("a").rank, 0);
    EXPECT_EQ(g.node("b").rank, 1);
}

TEST(SugiyamaLayoutTest, FreeFunctions_PickPipelines) {
    auto build = [] {
        LayoutGraph g = makeGraph();
        g.setNode("a", NodeLabel(20, 20));
        g.setNode("b", NodeLabel(20, 20));
        g.setEdge("a", "b");
        return g;
    };
    LayoutGraph conservative = build();
    LayoutGraph dagreish = build();

    layout(conservative);
    layoutDagreish(dagreish);

    // Only the full pipeline doubles minlen to make room for labels
    EXPECT_EQ(conservative.node("b").rank, 1);
    EXPECT_EQ(dagreish.node("b").rank, 2);
    EXPECT_EQ(conservative.edge("a", "b").points.size(), 3u);
}
