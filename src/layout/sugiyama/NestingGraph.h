#pragma once

#include "strata/core/LayoutGraph.h"

namespace strata {
namespace algorithms {

/**
 * @brief Scaffolding that keeps each subgraph in a contiguous band of ranks
 *
 * run() adds a synthetic root plus a top and bottom border node for every
 * compound node, then links them with nesting edges:
 * - root -> each top-level leaf and each top-level subgraph's top border
 * - a subgraph's top border -> each child (or the child's own top border)
 * - each child (or its bottom border) -> the subgraph's bottom border
 *
 * Every input minlen is multiplied by the node separation 2 * height + 1, which
 * leaves room between ranks for the borders. The factor is stored as
 * nodeRankFactor so removeEmptyRanks() can tell border ranks apart. Every node
 * hangs off the root, so the ranker sees one connected graph.
 *
 * cleanup() removes the root and every nesting edge; the border nodes stay and
 * their ranks become the subgraph's rank span.
 */
class NestingGraph {
public:
    static void run(LayoutGraph& g);
    static void cleanup(LayoutGraph& g);
};

}  // namespace algorithms
}  // namespace strata
