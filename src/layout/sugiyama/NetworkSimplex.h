#pragma once

#include "LayerAssignment.h"

#include <optional>
#include <string>
#include <unordered_set>

namespace strata {
namespace algorithms {

/**
 * @brief Network simplex ranking (Gansner et al.)
 *
 * Minimizes the weighted sum of edge lengths subject to minlen constraints:
 * 1. Collapse parallel edges (simplify)
 * 2. Longest path ranks, then a feasible tight tree
 * 3. Repeatedly swap a tree edge with negative cut value for the non-tree
 *    edge of minimum slack crossing the same cut, until no cut value is negative
 *
 * The individual steps are public so they can be tested in isolation.
 */
class NetworkSimplex {
public:
    /// Rank every node of @p g in place
    static void run(LayoutGraph& g);

    /// Postorder numbering of the tree: lim is the visit number, low the smallest
    /// lim in the subtree, parent the tree neighbour toward @p root. Every
    /// component of a forest is numbered, each from its first node.
    static void initLowLimValues(TreeGraph& tree, const std::optional<std::string>& root = std::nullopt);

    /// Cut value of every tree edge, children before parents
    static void initCutValues(TreeGraph& tree, const LayoutGraph& g);

    /// Cut value of the tree edge between @p child and its parent
    static double calcCutValue(const TreeGraph& tree, const LayoutGraph& g,
                               const std::string& child);

    /// First tree edge with a negative cut value
    static std::optional<EdgeKey> leaveEdge(const TreeGraph& tree);

    /// Non-tree edge of minimum slack that reconnects the two halves left
    /// after removing @p edge
    static EdgeKey enterEdge(const TreeGraph& tree, const LayoutGraph& g, const EdgeKey& edge);

    /// Replace tree edge @p e by @p f and refresh numbering, cut values and ranks
    static void exchangeEdges(TreeGraph& tree, LayoutGraph& g, const EdgeKey& e, const EdgeKey& f);

private:
    static int dfsAssignLowLim(TreeGraph& tree, std::unordered_set<std::string>& visited,
                               int nextLim, const std::string& v,
                               const std::optional<std::string>& parent);
    static void updateRanks(const TreeGraph& tree, LayoutGraph& g);
    static bool isDescendant(const TreeNodeLabel& v, const TreeNodeLabel& root) {
        return root.low <= v.lim && v.lim <= root.lim;
    }
};

}  // namespace algorithms
}  // namespace strata
