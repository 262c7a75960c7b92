#include <gtest/gtest.h>
#include <strata/core/LayoutGraph.h>

#include <stdexcept>

using namespace strata;

namespace {

using StringVec = std::vector<std::string>;

LayoutGraph makeMultigraph() {
    return LayoutGraph(GraphOptions{true, true, false});
}

LayoutGraph makeCompound() {
    return LayoutGraph(GraphOptions{true, false, true});
}

}  // namespace

// =============================================================================
// Nodes
// =============================================================================

TEST(GraphTest, SetNode_KeepsInsertionOrder) {
    LayoutGraph g;
    g.setNode("c");
    g.setNode("a");
    g.setNode("b");

    EXPECT_EQ(g.nodes(), (StringVec{"c", "a", "b"}));
    EXPECT_EQ(g.nodeCount(), 3u);
}

TEST(GraphTest, SetNode_WithoutLabelKeepsExistingLabel) {
    LayoutGraph g;
    g.setNode("a", NodeLabel(40, 20));
    g.setNode("a");

    EXPECT_DOUBLE_EQ(g.node("a").width, 40.0);
    EXPECT_DOUBLE_EQ(g.node("a").height, 20.0);
}

TEST(GraphTest, SetNode_WithLabelReplacesLabel) {
    LayoutGraph g;
    g.setNode("a", NodeLabel(40, 20));
    g.setNode("a", NodeLabel(10, 5));

    EXPECT_DOUBLE_EQ(g.node("a").width, 10.0);
    EXPECT_EQ(g.nodeCount(), 1u);
}

TEST(GraphTest, RemoveNode_DropsIncidentEdges) {
    LayoutGraph g;
    g.setNode("a");
    g.setNode("b");
    g.setNode("c");
    g.setEdge("a", "b");
    g.setEdge("b", "c");

    g.removeNode("b");

    EXPECT_FALSE(g.hasNode("b"));
    EXPECT_EQ(g.edgeCount(), 0u);
    EXPECT_TRUE(g.successors("a").empty());
    EXPECT_TRUE(g.predecessors("c").empty());
}

TEST(GraphTest, RemoveNode_ReAddedNodeGoesLast) {
    LayoutGraph g;
    g.setNode("a");
    g.setNode("b");
    g.removeNode("a");
    g.setNode("a");

    EXPECT_EQ(g.nodes(), (StringVec{"b", "a"}));
}

TEST(GraphTest, Node_MissingThrowsOutOfRange) {
    LayoutGraph g;
    EXPECT_THROW(g.node("nope"), std::out_of_range);
    EXPECT_EQ(g.findNode("nope"), nullptr);
}

TEST(GraphTest, SourcesAndSinks_FollowNodeOrder) {
    LayoutGraph g;
    for (const char* v : {"a", "b", "c", "d"}) {
        g.setNode(v);
    }
    g.setEdge("a", "c");
    g.setEdge("b", "c");
    g.setEdge("c", "d");

    EXPECT_EQ(g.sources(), (StringVec{"a", "b"}));
    EXPECT_EQ(g.sinks(), (StringVec{"d"}));
}

// =============================================================================
// Edges
// =============================================================================

TEST(GraphTest, SetEdge_MissingEndpointThrows) {
    LayoutGraph g;
    g.setNode("a");
    EXPECT_THROW(g.setEdge("a", "b"), std::invalid_argument);
    EXPECT_THROW(g.setEdge("b", "a"), std::invalid_argument);
}

TEST(GraphTest, SetEdge_ExistingKeyReplacesLabelInPlace) {
    LayoutGraph g;
    g.setNode("a");
    g.setNode("b");
    g.setNode("c");
    g.setEdge("a", "b");
    g.setEdge("a", "c");

    EdgeLabel label;
    label.weight = 5;
    g.setEdge("a", "b", label);

    EXPECT_EQ(g.edgeCount(), 2u);
    EXPECT_DOUBLE_EQ(g.edge("a", "b").weight, 5.0);
    EXPECT_EQ(g.edges().front(), (EdgeKey{"a", "b", std::nullopt}));
}

TEST(GraphTest, Edge_MissingThrowsOutOfRange) {
    LayoutGraph g;
    g.setNode("a");
    g.setNode("b");
    EXPECT_THROW(g.edge("a", "b"), std::out_of_range);
    EXPECT_EQ(g.findEdge("a", "b"), nullptr);
}

TEST(GraphTest, Multigraph_KeepsParallelEdgesApart) {
    LayoutGraph g = makeMultigraph();
    g.setNode("a");
    g.setNode("b");
    g.setEdge("a", "b");
    g.setEdge("a", "b", EdgeLabel{}, "x");
    g.setEdge("a", "b", EdgeLabel{}, "y");

    EXPECT_EQ(g.edgeCount(), 3u);
    EXPECT_EQ(g.outEdges("a").size(), 3u);
    EXPECT_EQ(g.successors("a"), (StringVec{"b"}));

    g.removeEdge("a", "b", "x");
    EXPECT_EQ(g.edgeCount(), 2u);
    EXPECT_EQ(g.successors("a"), (StringVec{"b"}));

    g.removeEdge("a", "b");
    g.removeEdge("a", "b", "y");
    EXPECT_TRUE(g.successors("a").empty());
}

TEST(GraphTest, SimpleGraph_IgnoresEdgeNames) {
    LayoutGraph g;
    g.setNode("a");
    g.setNode("b");
    g.setEdge("a", "b", EdgeLabel{}, "x");

    EXPECT_TRUE(g.hasEdge("a", "b"));
    EXPECT_FALSE(g.edges().front().name.has_value());
}

TEST(GraphTest, Adjacency_FollowsEdgeInsertionOrder) {
    LayoutGraph g;
    for (const char* v : {"a", "b", "c", "d"}) {
        g.setNode(v);
    }
    g.setEdge("c", "a");
    g.setEdge("a", "d");
    g.setEdge("b", "a");
    g.setEdge("a", "b");

    EXPECT_EQ(g.predecessors("a"), (StringVec{"c", "b"}));
    EXPECT_EQ(g.successors("a"), (StringVec{"d", "b"}));
    EXPECT_EQ(g.neighbors("a"), (StringVec{"c", "b", "d"}));

    std::vector<EdgeKey> nodeEdges = g.nodeEdges("a");
    ASSERT_EQ(nodeEdges.size(), 4u);
    EXPECT_EQ(nodeEdges[0].v, "c");
    EXPECT_EQ(nodeEdges[1].v, "b");
    EXPECT_EQ(nodeEdges[2].w, "d");
    EXPECT_EQ(nodeEdges[3].w, "b");
}

TEST(GraphTest, Undirected_CanonicalizesEndpoints) {
    LayoutGraph g(GraphOptions{false, false, false});
    g.setNode("a");
    g.setNode("b");
    g.setEdge("b", "a");

    EXPECT_TRUE(g.hasEdge("a", "b"));
    EXPECT_TRUE(g.hasEdge("b", "a"));
    EXPECT_EQ(g.edges().front().v, "a");
    EXPECT_EQ(g.edges().front().w, "b");
}

// =============================================================================
// Compound
// =============================================================================

TEST(GraphTest, SetParent_BuildsHierarchy) {
    LayoutGraph g = makeCompound();
    g.setNode("a");
    g.setNode("b");
    g.setNode("sg");
    g.setParent("a", "sg");
    g.setParent("b", "sg");

    EXPECT_EQ(g.parent("a"), "sg");
    EXPECT_EQ(g.children("sg"), (StringVec{"a", "b"}));
    EXPECT_EQ(g.children(), (StringVec{"sg"}));
    EXPECT_TRUE(g.hasChildren("sg"));
    EXPECT_FALSE(g.hasChildren("a"));
}

TEST(GraphTest, SetParent_RejectsSelfAndCycles) {
    LayoutGraph g = makeCompound();
    g.setNode("a");
    g.setNode("b");
    g.setParent("b", "a");

    EXPECT_THROW(g.setParent("a", "a"), std::invalid_argument);
    EXPECT_THROW(g.setParent("a", "b"), std::invalid_argument);
}

TEST(GraphTest, SetParent_NonCompoundThrows) {
    LayoutGraph g;
    g.setNode("a");
    g.setNode("b");
    EXPECT_THROW(g.setParent("a", "b"), std::invalid_argument);
    EXPECT_FALSE(g.parent("a").has_value());
}

TEST(GraphTest, RemoveNode_MovesChildrenToRoot) {
    LayoutGraph g = makeCompound();
    g.setNode("a");
    g.setNode("sg");
    g.setParent("a", "sg");

    g.removeNode("sg");

    EXPECT_FALSE(g.parent("a").has_value());
    EXPECT_EQ(g.children(), (StringVec{"a"}));
}

TEST(GraphTest, ClearParent_MovesNodeToRoot) {
    LayoutGraph g = makeCompound();
    g.setNode("a");
    g.setNode("sg");
    g.setParent("a", "sg");

    g.clearParent("a");

    EXPECT_FALSE(g.parent("a").has_value());
    EXPECT_TRUE(g.children("sg").empty());
}

// =============================================================================
// Traversal
// =============================================================================

TEST(GraphTest, Preorder_VisitsSuccessorsDepthFirst) {
    LayoutGraph g;
    for (const char* v : {"a", "b", "c", "d"}) {
        g.setNode(v);
    }
    g.setEdge("a", "b");
    g.setEdge("a", "c");
    g.setEdge("b", "d");

    EXPECT_EQ(g.preorder({"a"}), (StringVec{"a", "b", "d", "c"}));
}

TEST(GraphTest, Postorder_VisitsChildrenFirst) {
    LayoutGraph g;
    for (const char* v : {"a", "b", "c", "d"}) {
        g.setNode(v);
    }
    g.setEdge("a", "b");
    g.setEdge("a", "c");
    g.setEdge("b", "d");

    EXPECT_EQ(g.postorder({"a"}), (StringVec{"d", "b", "c", "a"}));
}
