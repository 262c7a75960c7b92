#pragma once

#include "strata/layout/ICycleRemoval.h"

namespace strata {
namespace algorithms {

/// Greedy feedback arc set (Eades, Lin and Smyth)
///
/// Parallel edges are merged with their weights summed (rounded to integers).
/// Nodes sit in buckets keyed by out-weight minus in-weight; sinks and sources
/// are drained first, then the node with the largest surplus is removed and its
/// remaining in-edges join the arc set. Every original edge between a selected
/// pair is returned.
class GreedyCycleRemoval : public ICycleRemoval {
public:
    const char* algorithmName() const override { return "Greedy"; }

    CycleRemovalResult findEdgesToReverse(const LayoutGraph& graph) const override;

    bool hasCycles(const LayoutGraph& graph) const override;
};

}  // namespace algorithms
}  // namespace strata
