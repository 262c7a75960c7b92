#pragma once

#include "strata/core/LayoutGraph.h"

namespace strata {

/// Conservative layered layout: longest-path ranks, rows centred per rank,
/// label-aware spacing, straight edges
void layout(LayoutGraph& graph);

/// Full Sugiyama pipeline (network simplex ranking, barycenter ordering,
/// Brandes-Koepf positioning), compound graphs included
void layoutDagreish(LayoutGraph& graph);

}  // namespace strata
