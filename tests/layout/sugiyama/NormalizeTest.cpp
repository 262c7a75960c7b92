#include <gtest/gtest.h>

#include "strata/core/LayoutGraph.h"

// Internal headers
#include "../../../src/layout/sugiyama/Normalize.h"

using namespace strata;
using namespace strata::algorithms;

namespace {

LayoutGraph makeGraph() {
    return LayoutGraph(GraphOptions{true, true, false});
}

void addRanked(LayoutGraph& g, const std::string& v, int rank) {
    NodeLabel label;
    label.rank = rank;
    g.setNode(v, label);
}

/// Node ids along the chain starting at v, ending at the first non-dummy
std::vector<std::string> walkChain(const LayoutGraph& g, std::string v) {
    std::vector<std::string> chain;
    while (true) {
        chain.push_back(v);
        if (!g.node(v).isDummy() && chain.size() > 1) {
            break;
        }
        auto next = g.successors(v);
        if (next.empty()) {
            break;
        }
        v = next.front();
    }
    return chain;
}

}  // namespace

// =============================================================================
// Run Tests
// =============================================================================

TEST(NormalizeTest, Run_LeavesUnitEdgesAlone) {
    LayoutGraph g = makeGraph();
    addRanked(g, "a", 0);
    addRanked(g, "b", 1);
    g.setEdge("a", "b");

    Normalize::run(g);

    EXPECT_EQ(g.nodeCount(), 2u);
    EXPECT_TRUE(g.hasEdge("a", "b"));
    EXPECT_TRUE(g.graph().dummyChains.empty());
}

TEST(NormalizeTest, Run_SplitsLongEdgeIntoChain) {
    LayoutGraph g = makeGraph();
    addRanked(g, "a", 0);
    addRanked(g, "b", 3);
    EdgeLabel label;
    label.weight = 2;
    g.setEdge("a", "b", label, "n");

    Normalize::run(g);

    EXPECT_FALSE(g.hasEdge("a", "b", "n"));
    ASSERT_EQ(g.graph().dummyChains.size(), 1u);
    auto chain = walkChain(g, "a");
    ASSERT_EQ(chain.size(), 4u);
    EXPECT_EQ(chain.front(), "a");
    EXPECT_EQ(chain.back(), "b");
    EXPECT_EQ(chain[1], g.graph().dummyChains.front());

    for (size_t i = 1; i + 1 < chain.size(); ++i) {
        const NodeLabel& dummy = g.node(chain[i]);
        EXPECT_EQ(dummy.dummy, DummyKind::Edge);
        EXPECT_EQ(dummy.rank, static_cast<int>(i));
        EXPECT_DOUBLE_EQ(dummy.width, 0.0);
        ASSERT_TRUE(dummy.edgeObj.has_value());
        EXPECT_EQ(*dummy.edgeObj, (EdgeKey{"a", "b", "n"}));
    }
    for (const auto& e : g.edges()) {
        EXPECT_EQ(e.name, "n");
        EXPECT_DOUBLE_EQ(g.edge(e).weight, 2.0);
    }
}

TEST(NormalizeTest, Run_LabelDummyTakesLabelBox) {
    LayoutGraph g = makeGraph();
    addRanked(g, "a", 0);
    addRanked(g, "b", 4);
    EdgeLabel label;
    label.width = 30;
    label.height = 12;
    label.labelpos = LabelPos::L;
    label.labelRank = 2;
    g.setEdge("a", "b", label);

    Normalize::run(g);

    auto chain = walkChain(g, "a");
    ASSERT_EQ(chain.size(), 5u);
    const NodeLabel& labelDummy = g.node(chain[2]);
    EXPECT_EQ(labelDummy.dummy, DummyKind::EdgeLabel);
    EXPECT_DOUBLE_EQ(labelDummy.width, 30.0);
    EXPECT_DOUBLE_EQ(labelDummy.height, 12.0);
    EXPECT_EQ(labelDummy.labelpos, LabelPos::L);
    EXPECT_DOUBLE_EQ(g.node(chain[1]).width, 0.0);
    EXPECT_EQ(g.node(chain[1]).dummy, DummyKind::Edge);
}

// =============================================================================
// Undo Tests
// =============================================================================

TEST(NormalizeTest, Undo_RestoresEdgeWithPoints) {
    LayoutGraph g = makeGraph();
    addRanked(g, "a", 0);
    addRanked(g, "b", 3);
    EdgeLabel label;
    label.weight = 2;
    label.width = 10;
    label.height = 6;
    label.labelRank = 2;
    g.setEdge("a", "b", label, "n");

    Normalize::run(g);
    auto chain = walkChain(g, "a");
    ASSERT_EQ(chain.size(), 4u);
    g.node(chain[1]).x = 5;
    g.node(chain[1]).y = 10;
    g.node(chain[2]).x = 15;
    g.node(chain[2]).y = 20;

    Normalize::undo(g);

    EXPECT_EQ(g.nodeCount(), 2u);
    ASSERT_TRUE(g.hasEdge("a", "b", "n"));
    const EdgeLabel& restored = g.edge("a", "b", "n");
    EXPECT_DOUBLE_EQ(restored.weight, 2.0);
    ASSERT_EQ(restored.points.size(), 2u);
    EXPECT_EQ(restored.points[0], (Point{5, 10}));
    EXPECT_EQ(restored.points[1], (Point{15, 20}));
    EXPECT_EQ(restored.x, 15.0);
    EXPECT_EQ(restored.y, 20.0);
    EXPECT_DOUBLE_EQ(restored.width, 10.0);
}

TEST(NormalizeTest, Undo_HandlesSeveralChains) {
    LayoutGraph g = makeGraph();
    addRanked(g, "a", 0);
    addRanked(g, "b", 2);
    addRanked(g, "c", 2);
    g.setEdge("a", "b");
    g.setEdge("a", "c");

    Normalize::run(g);
    ASSERT_EQ(g.graph().dummyChains.size(), 2u);
    EXPECT_EQ(g.nodeCount(), 5u);

    for (const auto& v : g.nodes()) {
        g.node(v).x = 1;
        g.node(v).y = 1;
    }
    Normalize::undo(g);

    EXPECT_EQ(g.nodeCount(), 3u);
    EXPECT_EQ(g.edge("a", "b").points.size(), 1u);
    EXPECT_EQ(g.edge("a", "c").points.size(), 1u);
}

TEST(NormalizeTest, Undo_RoundTripRestoresLabelAndChainPoints) {
    LayoutGraph g = makeGraph();
    addRanked(g, "a", 0);
    addRanked(g, "b", 5);
    addRanked(g, "c", 1);
    g.setEdge("a", "c");
    EdgeLabel label;
    label.minlen = 5;
    label.weight = 3;
    label.width = 30;
    label.height = 12;
    label.labelpos = LabelPos::L;
    label.labeloffset = 7;
    label.labelRank = 3;
    g.setEdge("a", "b", label, "n");

    Normalize::run(g);
    ASSERT_EQ(g.graph().dummyChains.size(), 1u);
    auto chain = walkChain(g, g.graph().dummyChains.front());
    ASSERT_EQ(chain.size(), 5u);
    EXPECT_EQ(chain.back(), "b");
    ASSERT_EQ(g.node(chain[2]).dummy, DummyKind::EdgeLabel);
    for (size_t i = 0; i + 1 < chain.size(); ++i) {
        g.node(chain[i]).x = 10.0 * static_cast<double>(i + 1);
        g.node(chain[i]).y = 100.0 * static_cast<double>(i + 1);
    }

    Normalize::undo(g);

    EXPECT_EQ(g.nodeCount(), 3u);
    EXPECT_EQ(g.edgeCount(), 2u);
    EXPECT_TRUE(g.edge("a", "c").points.empty());

    ASSERT_TRUE(g.hasEdge("a", "b", "n"));
    const EdgeLabel& restored = g.edge("a", "b", "n");
    EXPECT_EQ(restored.minlen, 5);
    EXPECT_DOUBLE_EQ(restored.weight, 3.0);
    EXPECT_DOUBLE_EQ(restored.width, 30.0);
    EXPECT_DOUBLE_EQ(restored.height, 12.0);
    EXPECT_EQ(restored.labelpos, LabelPos::L);
    EXPECT_DOUBLE_EQ(restored.labeloffset, 7.0);
    ASSERT_EQ(restored.points.size(), 4u);
    for (size_t i = 0; i < restored.points.size(); ++i) {
        double k = static_cast<double>(i + 1);
        EXPECT_EQ(restored.points[i], (Point{10.0 * k, 100.0 * k}));
    }
    EXPECT_EQ(restored.x, 30.0);
    EXPECT_EQ(restored.y, 300.0);
}
