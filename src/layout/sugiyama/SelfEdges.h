#pragma once

#include "strata/core/LayoutGraph.h"

namespace strata {
namespace algorithms {

/// Self-loops are kept out of ranking and ordering and come back as
/// placeholder nodes just before x positioning.
class SelfEdges {
public:
    /// Move every self-loop onto its node's selfEdges list
    static void remove(LayoutGraph& g);

    /// Add one placeholder right of its node per stored self-loop, shifting
    /// the orders of the rest of the layer
    static void insert(LayoutGraph& g);

    /// Turn each placeholder into a five-point loop on the right side of its
    /// node, restore the edge and drop the placeholder
    static void position(LayoutGraph& g);
};

}  // namespace algorithms
}  // namespace strata
