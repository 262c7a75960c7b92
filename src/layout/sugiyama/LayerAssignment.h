#pragma once

#include "strata/layout/ILayerAssignment.h"
#include "strata/layout/config/LayoutOptions.h"

#include <memory>
#include <optional>
#include <string>

namespace strata {
namespace algorithms {

struct TreeNodeLabel {
    int low = 0;
    int lim = 0;
    std::optional<std::string> parent;
};

struct TreeEdgeLabel {
    double cutvalue = 0.0;
};

struct TreeGraphLabel {};

/// Undirected spanning tree (or forest) over a ranked graph
using TreeGraph = BasicGraph<TreeNodeLabel, TreeEdgeLabel, TreeGraphLabel>;

/// Building blocks shared by the rankers
class Ranking {
public:
    /// Initial ranks: each node sits minlen above its lowest successor,
    /// sinks at 0, so every rank is <= 0. Visits sources in node order.
    static void longestPath(LayoutGraph& g);

    /// rank(w) - rank(v) - minlen; missing ranks count as 0
    static int slack(const LayoutGraph& g, const EdgeKey& e);

    /**
     * @brief Grow a tree of tight edges (slack 0), shifting ranks to make more edges tight
     *
     * The tree starts at the first node. While it does not span the graph, the
     * edge with minimum slack between the tree and the rest is made tight by
     * shifting every tree node. When no edge leaves the tree the next node outside
     * it starts a new component, so disconnected input yields a forest.
     *
     * @return The tree; g's ranks are updated in place
     */
    static TreeGraph feasibleTree(LayoutGraph& g);

    /// Highest and lowest rank in g
    static LayerAssignmentResult summarize(const LayoutGraph& g);

private:
    static size_t tightTree(TreeGraph& t, const LayoutGraph& g);
    static void tightTreeDfs(TreeGraph& t, const LayoutGraph& g, const std::string& v);
};

class LongestPathLayerAssignment : public ILayerAssignment {
public:
    const char* algorithmName() const override { return "longest-path"; }
    LayerAssignmentResult assignLayers(LayoutGraph& graph) const override;
};

/// Longest path followed by a feasible tight tree
class TightTreeLayerAssignment : public ILayerAssignment {
public:
    const char* algorithmName() const override { return "tight-tree"; }
    LayerAssignmentResult assignLayers(LayoutGraph& graph) const override;
};

class NetworkSimplexLayerAssignment : public ILayerAssignment {
public:
    const char* algorithmName() const override { return "network-simplex"; }
    LayerAssignmentResult assignLayers(LayoutGraph& graph) const override;
};

/// Keeps ranks already present on the nodes
class PresetLayerAssignment : public ILayerAssignment {
public:
    const char* algorithmName() const override { return "none"; }
    LayerAssignmentResult assignLayers(LayoutGraph& graph) const override;
};

std::unique_ptr<ILayerAssignment> makeLayerAssignment(RankingStrategy strategy);

}  // namespace algorithms
}  // namespace strata
