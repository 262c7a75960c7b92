#pragma once

#include "strata/core/LayoutGraph.h"

#include <optional>
#include <string>
#include <vector>

namespace strata {
namespace algorithms {

/// Node of a single-rank view. Subgraph slices carry only the borders of
/// that rank and no order.
struct LayerNode {
    std::optional<int> order;
    std::optional<std::string> borderLeft;
    std::optional<std::string> borderRight;
};

struct LayerEdge {
    double weight = 0.0;
};

struct LayerGraphLabel {
    std::string root;
};

/// Nodes of one rank with their nesting, plus weighted edges from the
/// neighbouring rank. Edges always point into the rank being sorted.
using LayerGraph = BasicGraph<LayerNode, LayerEdge, LayerGraphLabel>;

enum class Relationship {
    InEdges,   // Neighbours on the rank above (down sweep)
    OutEdges   // Neighbours on the rank below (up sweep)
};

class LayerGraphBuilder {
public:
    /**
     * @brief Build the view of @p rank used by one sort step
     *
     * Every node whose rank is @p rank, or whose minRank..maxRank span contains
     * it, is added under its parent (top-level nodes go under @p root). Edges
     * selected by @p relationship are added as u -> v where u is the neighbour,
     * with parallel edges summed into one weight.
     *
     * @param nodes Candidates in node order; all nodes of g when null
     */
    static LayerGraph build(const LayoutGraph& g, int rank, Relationship relationship,
                            const std::string& root,
                            const std::vector<std::string>* nodes = nullptr);

    /// Id not used by any node of g
    static std::string createRootNode(const LayoutGraph& g);

    /// Refresh the orders cached in @p lg from g. Slices keep no order.
    static void syncOrders(const LayoutGraph& g, LayerGraph& lg);
};

}  // namespace algorithms
}  // namespace strata
