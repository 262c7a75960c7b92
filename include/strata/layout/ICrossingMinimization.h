#pragma once

#include "strata/core/LayoutGraph.h"

#include <vector>

namespace strata {

/// Result of crossing minimization
struct CrossingMinimizationResult {
    double crossings = 0.0;  ///< Weighted crossings of the ordering kept
    int sweeps = 0;          ///< Sweeps performed, improving or not
};

/// Abstract interface for ordering the nodes within each rank
///
/// The graph handed in is ranked and proper: every edge spans exactly one rank.
/// Implementations write NodeLabel::order as a permutation 0..n-1 of each rank.
/// Compound nodes may be present with minRank/maxRank and side borders; their
/// members must stay contiguous between the borders.
class ICrossingMinimization {
public:
    virtual ~ICrossingMinimization() = default;

    virtual CrossingMinimizationResult minimize(LayoutGraph& graph) const = 0;

    /// Weighted crossings of @p layering, each layer listed left to right
    virtual double countCrossings(const LayoutGraph& graph,
                                  const Layering& layering) const = 0;

    /// Name used in log output
    virtual const char* algorithmName() const = 0;
};

}  // namespace strata
