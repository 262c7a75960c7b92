#pragma once

#include "strata/core/LayoutGraph.h"

namespace strata {
namespace algorithms {

/// Re-parents the dummies of each long edge so the chain climbs from its
/// source's subgraph to the lowest common ancestor of both endpoints and then
/// descends into the target's, entering each subgraph only on ranks it spans.
class ParentDummyChains {
public:
    static void run(LayoutGraph& g);
};

}  // namespace algorithms
}  // namespace strata
