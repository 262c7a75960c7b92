#pragma once

#include "strata/core/LayoutGraph.h"

#include <memory>

namespace strata {

// Interfaces
class ICycleRemoval;
class ILayerAssignment;
class ICrossingMinimization;
class ICoordinateAssignment;

/// Sugiyama-style hierarchical graph layout
///
/// Both entry points copy the input into a working multigraph, lay the copy
/// out and write the results back:
/// - nodes receive centre x/y, rank and order; compound nodes also receive
///   their rank span and box
/// - edges receive their routing points and label centre
///
/// layoutDagreish runs the full pipeline:
/// 1. Cycle Removal - Reverse a feedback arc set
/// 2. Layer Assignment - Rank the leaves, nested in a nesting graph when compound
/// 3. Normalization - Split long edges into chains of dummy nodes
/// 4. Crossing Minimization - Order each rank with barycenter sweeps
/// 5. Coordinate Assignment - Brandes-Koepf x, stacked y
/// 6. Edge Routing - Collect dummy points and clip the ends to the node boxes
///
/// layoutConservative ranks by longest path and centres each rank as a row,
/// without dummy nodes or crossing reduction.
class SugiyamaLayout {
public:
    SugiyamaLayout();
    ~SugiyamaLayout();

    // Non-copyable, movable
    SugiyamaLayout(const SugiyamaLayout&) = delete;
    SugiyamaLayout& operator=(const SugiyamaLayout&) = delete;
    SugiyamaLayout(SugiyamaLayout&&) noexcept;
    SugiyamaLayout& operator=(SugiyamaLayout&&) noexcept;

    /// Full pipeline. Options are read from the graph label.
    /// @throws std::invalid_argument if an edge references a missing node
    void layoutDagreish(LayoutGraph& graph);

    /// Conservative pipeline. Options are read from the graph label.
    void layoutConservative(LayoutGraph& graph);

    /// Get statistics from last layout
    struct LayoutStats {
        int rankCount = 0;
        size_t dummyCount = 0;     ///< Dummy nodes present during ordering
        size_t reversedEdges = 0;
        double crossings = 0.0;    ///< Weighted crossings of the final ordering
        int sweeps = 0;
    };
    const LayoutStats& lastStats() const { return stats_; }

    /// Algorithm injection (for swapping implementations)
    /// If not set, the strategies named in the graph options are used
    void setCycleRemoval(std::shared_ptr<ICycleRemoval> impl);
    void setLayerAssignment(std::shared_ptr<ILayerAssignment> impl);
    void setCrossingMinimization(std::shared_ptr<ICrossingMinimization> impl);
    void setCoordinateAssignment(std::shared_ptr<ICoordinateAssignment> impl);

private:
    LayoutStats stats_;

    // Algorithm implementations (nullptr = from graph options)
    std::shared_ptr<ICycleRemoval> cycleRemoval_;
    std::shared_ptr<ILayerAssignment> layerAssignment_;
    std::shared_ptr<ICrossingMinimization> crossingMinimization_;
    std::shared_ptr<ICoordinateAssignment> coordinateAssignment_;

    // Internal layout state
    struct LayoutState;
    std::unique_ptr<LayoutState> state_;

    void buildWorkingGraph(const LayoutGraph& input);
    void updateInputGraph(LayoutGraph& input) const;

    // Full pipeline phases, on the working graph
    void makeSpaceForEdgeLabels();
    void removeCycles();
    void rank();
    void injectEdgeLabelProxies();
    void removeEdgeLabelProxies();
    void normalize();
    void order();
    void position();
    void denormalize();
    void translate();
    void routeEdgeEnds();
};

}  // namespace strata
