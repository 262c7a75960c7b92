#pragma once

#include "strata/layout/ICycleRemoval.h"

#include <unordered_set>
#include <vector>

namespace strata {
namespace algorithms {

/// DFS-based cycle removal
///
/// Visits nodes in insertion order and follows out-edges in insertion order;
/// an edge into a node still on the DFS stack is a back edge. Self-loops are
/// ignored.
class CycleRemoval : public ICycleRemoval {
public:
    using Result = CycleRemovalResult;

    CycleRemoval() = default;

    const char* algorithmName() const override { return "DFS"; }

    CycleRemovalResult findEdgesToReverse(const LayoutGraph& graph) const override;

    bool hasCycles(const LayoutGraph& graph) const override;

private:
    void dfs(const std::string& node, const LayoutGraph& graph,
             std::unordered_set<std::string>& visited,
             std::unordered_set<std::string>& onStack,
             std::vector<EdgeKey>& backEdges) const;
};

/// Reversal of a feedback arc set and its inverse
class Acyclic {
public:
    /// Reverse the edges @p strategy selects. A reversed edge is renamed
    /// "rev<N>" and remembers its original name.
    /// @return Number of edges reversed
    static size_t run(LayoutGraph& graph, const ICycleRemoval& strategy);

    /// Restore every reversed edge, its name and its point order
    static void undo(LayoutGraph& graph);
};

}  // namespace algorithms
}  // namespace strata
