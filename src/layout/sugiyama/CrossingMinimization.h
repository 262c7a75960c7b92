#pragma once

#include "Barycenter.h"
#include "LayerGraph.h"
#include "strata/layout/ICrossingMinimization.h"

#include <string>
#include <vector>

namespace strata {
namespace algorithms {

/// Building blocks of the layer sweep
class Ordering {
public:
    /// Sweeps in a row without improvement before giving up
    static constexpr int kMaxSweepsWithoutImprovement = 4;

    /// Initial layering: DFS from the leaves in rank order, each node appended
    /// to its rank when first reached
    static Layering initOrder(const LayoutGraph& g);

    /// Write each node's position within its layer as its order
    static void assignOrder(LayoutGraph& g, const Layering& layering);

    /// Weighted crossings between consecutive layers, counted with an
    /// accumulator tree (Barth, Juenger and Mutzel)
    static double crossCount(const LayoutGraph& g,
                             const Layering& layering);

    /// Record that the subgraphs met along @p vs keep their relative order
    static void addSubgraphConstraints(const LayerGraph& lg, ConstraintGraph& cg,
                                       const std::vector<std::string>& vs);

    /// Reorder every rank once using the given layer graphs, in sequence
    static void sweep(LayoutGraph& g, std::vector<LayerGraph>& layerGraphs, bool biasRight);

    /**
     * @brief Alternate down and up sweeps and keep the ordering with the fewest crossings
     *
     * Sweep i goes down when i is odd and breaks ties to the right when i % 4 >= 2.
     * Stops after kMaxSweepsWithoutImprovement sweeps in a row that did not strictly
     * reduce the crossing count. The initial DFS layering is kept when every sweep
     * ends with more crossings than it had.
     */
    static CrossingMinimizationResult order(LayoutGraph& g);

private:
    static std::vector<LayerGraph> buildLayerGraphs(const LayoutGraph& g,
                                                    const std::vector<int>& ranks,
                                                    Relationship relationship);
};

/// Layer sweep with the barycenter heuristic, nesting aware
class BarycenterCrossingMinimization : public ICrossingMinimization {
public:
    using Result = CrossingMinimizationResult;

    BarycenterCrossingMinimization() = default;

    const char* algorithmName() const override { return "Barycenter"; }

    CrossingMinimizationResult minimize(LayoutGraph& graph) const override;

    double countCrossings(const LayoutGraph& graph,
                          const Layering& layering) const override;
};

}  // namespace algorithms
}  // namespace strata
