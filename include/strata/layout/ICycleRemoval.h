#pragma once

#include "strata/core/LayoutGraph.h"

#include <vector>

namespace strata {

/// Result of feedback arc set selection
struct CycleRemovalResult {
    std::vector<EdgeKey> reversedEdges;  ///< Edges to reverse, self-loops excluded
    bool isAcyclic = false;              ///< True when nothing needs reversing
};

/// Abstract interface for choosing the edges to reverse before ranking
///
/// Implementations only select edges; the pipeline performs the reversal and
/// restores direction, edge names and point order after layout.
class ICycleRemoval {
public:
    virtual ~ICycleRemoval() = default;

    /// Select a feedback arc set. Does not modify the graph.
    virtual CycleRemovalResult findEdgesToReverse(const LayoutGraph& graph) const = 0;

    virtual bool hasCycles(const LayoutGraph& graph) const = 0;

    /// Name used in log output
    virtual const char* algorithmName() const = 0;
};

}  // namespace strata
