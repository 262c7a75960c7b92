#include <gtest/gtest.h>

#include "strata/core/LayoutGraph.h"

// Internal headers
#include "../../../src/layout/sugiyama/SelfEdges.h"

using namespace strata;
using namespace strata::algorithms;

namespace {

LayoutGraph makeGraph() {
    return LayoutGraph(GraphOptions{true, true, false});
}

std::optional<std::string> findSelfEdgeDummy(const LayoutGraph& g) {
    for (const auto& v : g.nodes()) {
        if (g.node(v).dummy == DummyKind::SelfEdge) {
            return v;
        }
    }
    return std::nullopt;
}

}  // namespace

TEST(SelfEdgesTest, Remove_MovesLoopsOntoNode) {
    LayoutGraph g = makeGraph();
    g.setNode("a");
    g.setNode("b");
    EdgeLabel label;
    label.width = 12;
    g.setEdge("a", "a", label, "loop");
    g.setEdge("a", "b");

    SelfEdges::remove(g);

    EXPECT_FALSE(g.hasEdge("a", "a", "loop"));
    EXPECT_TRUE(g.hasEdge("a", "b"));
    ASSERT_EQ(g.node("a").selfEdges.size(), 1u);
    EXPECT_EQ(g.node("a").selfEdges[0].edgeObj, (EdgeKey{"a", "a", "loop"}));
    EXPECT_DOUBLE_EQ(g.node("a").selfEdges[0].label.width, 12.0);
}

TEST(SelfEdgesTest, Insert_PlacesPlaceholderRightOfNode) {
    LayoutGraph g = makeGraph();
    for (const char* v : {"a", "b"}) {
        NodeLabel label(10, 10);
        label.rank = 0;
        g.setNode(v, label);
    }
    g.node("a").order = 0;
    g.node("b").order = 1;
    g.setEdge("a", "a");
    SelfEdges::remove(g);

    SelfEdges::insert(g);

    auto dummy = findSelfEdgeDummy(g);
    ASSERT_TRUE(dummy.has_value());
    const NodeLabel& placeholder = g.node(*dummy);
    EXPECT_EQ(placeholder.rank, 0);
    EXPECT_EQ(placeholder.order, 1);
    EXPECT_EQ(placeholder.edgeObj, (EdgeKey{"a", "a"}));
    EXPECT_EQ(g.node("a").order, 0);
    EXPECT_EQ(g.node("b").order, 2);
    EXPECT_TRUE(g.node("a").selfEdges.empty());
}

TEST(SelfEdgesTest, Insert_SeveralLoopsShiftLayer) {
    LayoutGraph g = makeGraph();
    for (const char* v : {"a", "b"}) {
        NodeLabel label;
        label.rank = 0;
        g.setNode(v, label);
    }
    g.node("a").order = 0;
    g.node("b").order = 1;
    g.setEdge("a", "a", EdgeLabel{}, "x");
    g.setEdge("a", "a", EdgeLabel{}, "y");
    SelfEdges::remove(g);

    SelfEdges::insert(g);

    EXPECT_EQ(g.nodeCount(), 4u);
    EXPECT_EQ(g.node("b").order, 3);
}

TEST(SelfEdgesTest, Position_BuildsLoopOnRightSide) {
    LayoutGraph g = makeGraph();
    NodeLabel node(10, 20);
    node.rank = 0;
    node.order = 0;
    g.setNode("a", node);
    EdgeLabel label;
    label.weight = 3;
    g.setEdge("a", "a", label);
    SelfEdges::remove(g);
    SelfEdges::insert(g);

    g.node("a").x = 0;
    g.node("a").y = 0;
    std::string dummy = *findSelfEdgeDummy(g);
    g.node(dummy).x = 15;
    g.node(dummy).y = 0;

    SelfEdges::position(g);

    EXPECT_FALSE(g.hasNode(dummy));
    ASSERT_TRUE(g.hasEdge("a", "a"));
    const EdgeLabel& loop = g.edge("a", "a");
    EXPECT_DOUBLE_EQ(loop.weight, 3.0);
    EXPECT_EQ(loop.x, 15.0);
    EXPECT_EQ(loop.y, 0.0);
    ASSERT_EQ(loop.points.size(), 5u);
    EXPECT_NEAR(loop.points[0].x, 5 + 20.0 / 3, 1e-9);
    EXPECT_DOUBLE_EQ(loop.points[0].y, -10.0);
    EXPECT_NEAR(loop.points[1].x, 5 + 50.0 / 6, 1e-9);
    EXPECT_DOUBLE_EQ(loop.points[2].x, 15.0);
    EXPECT_DOUBLE_EQ(loop.points[2].y, 0.0);
    EXPECT_DOUBLE_EQ(loop.points[4].y, 10.0);
}
