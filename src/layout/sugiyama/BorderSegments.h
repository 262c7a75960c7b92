#pragma once

#include "strata/core/LayoutGraph.h"

namespace strata {
namespace algorithms {

/// Rank span and side borders of compound nodes
class BorderSegments {
public:
    /// minRank/maxRank of each subgraph from the ranks of its top and bottom borders
    static void assignRankMinMax(LayoutGraph& g);

    /// One left and one right border node per rank a subgraph spans, chained
    /// top to bottom, so ordering keeps the subgraph's members between them
    static void add(LayoutGraph& g);

    /// Size each subgraph from its positioned borders, then drop all border nodes.
    /// The box spans the leftmost left border to the rightmost right border and
    /// the top border to the bottom border.
    static void removeBorderNodes(LayoutGraph& g);
};

}  // namespace algorithms
}  // namespace strata
