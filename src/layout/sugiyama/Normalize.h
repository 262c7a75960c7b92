#pragma once

#include "strata/core/LayoutGraph.h"

namespace strata {
namespace algorithms {

/// Splits edges spanning several ranks into chains of unit-length edges.
///
/// run() gives each intermediate rank a zero-sized dummy node carrying the
/// original edge label and key. The dummy on the edge's labelRank takes the label
/// box instead. The head of every chain is recorded in GraphLabel::dummyChains.
/// undo() walks each chain, collects the dummy positions as the edge's points,
/// removes the dummies and restores the original edge.
class Normalize {
public:
    static void run(LayoutGraph& g);
    static void undo(LayoutGraph& g);
};

}  // namespace algorithms
}  // namespace strata
