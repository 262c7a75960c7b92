#pragma once

#include "strata/core/LayoutGraph.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace strata {
namespace algorithms {

/// Summary of one conservative run
struct ConservativeLayoutResult {
    Layering layering;
    size_t reversedEdges = 0;
};

/**
 * @brief Label-aware layered placement without dummy nodes or crossing reduction
 *
 * Leaves are ranked by longest path in Kahn order, compound children are pulled
 * onto a common rank where their edges allow it, and each rank is centred as a
 * row. Long edge labels widen the spacing: nodesep grows to the widest label
 * (tallest for LR/RL) and LR/RL ranksep grows to the widest label. Edges are
 * straight polylines with 2 * minlen + 1 points from the bottom of the source
 * to the top of the target; self-loops get a fixed loop to the right of the
 * node. Compound nodes are sized to the union of their members.
 *
 * The graph must already be acyclic; the caller reverses and restores edges.
 */
class ConservativeLayout {
public:
    static ConservativeLayoutResult run(LayoutGraph& g);

    /// Longest-path ranks of the leaves. Falls back to rank 0 for every leaf
    /// when a cycle is left.
    static std::unordered_map<std::string, int> rankLeaves(const LayoutGraph& g,
                                                           const std::vector<std::string>& leaves);

    /// Move the ranked children of each compound node to one shared rank when
    /// a rank satisfying all their in- and out-edges exists
    static void compactSubgraphs(const LayoutGraph& g, std::unordered_map<std::string, int>& rank);

private:
    static void routeEdges(LayoutGraph& g);
    static void applyRankDir(LayoutGraph& g, const std::vector<std::string>& leaves,
                             double totalHeight);
    static void sizeSubgraphs(LayoutGraph& g);
};

}  // namespace algorithms
}  // namespace strata
