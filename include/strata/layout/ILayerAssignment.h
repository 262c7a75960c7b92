#pragma once

#include "strata/core/LayoutGraph.h"

namespace strata {

/// Summary of a rank assignment
struct LayerAssignmentResult {
    int minRank = 0;
    int maxRank = 0;
    size_t rankedNodes = 0;  ///< Nodes that ended up with a rank
};

/// Abstract interface for rank (layer) assignment
///
/// The graph handed in is acyclic and holds no compound nodes. Implementations
/// write NodeLabel::rank so that rank(w) - rank(v) >= minlen for every edge.
/// Ranks may be negative; the pipeline normalizes them afterwards.
class ILayerAssignment {
public:
    virtual ~ILayerAssignment() = default;

    virtual LayerAssignmentResult assignLayers(LayoutGraph& graph) const = 0;

    /// Name used in log output
    virtual const char* algorithmName() const = 0;
};

}  // namespace strata
