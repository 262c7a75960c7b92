#pragma once

#include "LayerGraph.h"

#include <optional>
#include <string>
#include <vector>

namespace strata {
namespace algorithms {

struct ConstraintNode {};
struct ConstraintEdge {};
struct ConstraintGraphLabel {};

/// "Left sibling precedes right sibling" facts collected while sweeping a rank
using ConstraintGraph = BasicGraph<ConstraintNode, ConstraintEdge, ConstraintGraphLabel>;

struct BarycenterEntry {
    std::string v;
    std::optional<double> barycenter;  // Absent when v has no in-edge
    std::optional<double> weight;
};

/// A group of nodes that moves as one unit
struct SortEntry {
    std::vector<std::string> vs;
    size_t i = 0;  // Position of the group's first member before sorting
    std::optional<double> barycenter;
    std::optional<double> weight;
};

struct SortResult {
    std::vector<std::string> vs;
    std::optional<double> barycenter;
    std::optional<double> weight;
};

/// Barycenter heuristic over one layer graph
class Barycenter {
public:
    /// Weighted mean order of each node's in-neighbours
    static std::vector<BarycenterEntry> compute(const LayerGraph& lg,
                                                const std::vector<std::string>& movable);

    /**
     * @brief Merge entries whose barycenters contradict @p cg
     *
     * For a constraint u -> v, the entries are merged when either barycenter is
     * missing or u's is not smaller than v's. Entries are visited as a stack of
     * unconstrained groups; the output follows the visiting order and omits
     * groups that were merged into another.
     */
    static std::vector<SortEntry> resolveConflicts(const std::vector<BarycenterEntry>& entries,
                                                   const ConstraintGraph& cg);

    /**
     * @brief Order entries by barycenter, keeping entries without one in place
     *
     * Ties go to the lower original index, or the higher one with @p biasRight.
     * An entry without a barycenter is emitted as soon as the output reaches its
     * original index.
     */
    static SortResult sort(const std::vector<SortEntry>& entries, bool biasRight);

    /// Sort the children of @p v, recursing into nested subgraphs and keeping
    /// v's border nodes at both ends
    static SortResult sortSubgraph(const LayerGraph& lg, const std::string& v,
                                   const ConstraintGraph& cg, bool biasRight);
};

}  // namespace algorithms
}  // namespace strata
