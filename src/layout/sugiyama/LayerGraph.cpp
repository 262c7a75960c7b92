#include "LayerGraph.h"
#include "strata/layout/util/LayoutUtils.h"

namespace strata {
namespace algorithms {

namespace {

LayerNode liteLabel(const NodeLabel& node) {
    LayerNode label;
    label.order = node.order;
    return label;
}

std::optional<std::string> borderAt(const std::vector<std::optional<std::string>>& borders,
                                    int rank) {
    if (rank < 0 || static_cast<size_t>(rank) >= borders.size()) {
        return std::nullopt;
    }
    return borders[rank];
}

LayerNode sliceLabel(const NodeLabel& node, int rank) {
    LayerNode label;
    label.borderLeft = borderAt(node.borderLeft, rank);
    label.borderRight = borderAt(node.borderRight, rank);
    return label;
}

void ensureNeighbour(const LayoutGraph& g, LayerGraph& lg, const std::string& u) {
    if (!lg.hasNode(u)) {
        lg.setNode(u, liteLabel(g.node(u)));
    }
}

void addWeightedEdge(LayerGraph& lg, const std::string& u, const std::string& v, double weight) {
    double existing = 0.0;
    if (const LayerEdge* edge = lg.findEdge(u, v)) {
        existing = edge->weight;
    }
    lg.setEdge(u, v, LayerEdge{weight + existing});
}

}  // namespace

LayerGraph LayerGraphBuilder::build(const LayoutGraph& g, int rank, Relationship relationship,
                                    const std::string& root,
                                    const std::vector<std::string>* nodes) {
    LayerGraph result(GraphOptions{true, false, true});
    result.setGraph(LayerGraphLabel{root});
    result.setNode(root);

    auto visit = [&](const std::string& v) {
        const NodeLabel& node = g.node(v);
        bool inRange = (node.rank && *node.rank == rank) ||
                       (node.minRank && node.maxRank && *node.minRank <= rank &&
                        rank <= *node.maxRank);
        if (!inRange) {
            return;
        }

        result.setNode(v, node.minRank ? sliceLabel(node, rank) : liteLabel(node));
        result.setParent(v, g.parent(v).value_or(root));

        if (relationship == Relationship::InEdges) {
            for (const auto& e : g.inEdges(v)) {
                ensureNeighbour(g, result, e.v);
                addWeightedEdge(result, e.v, v, g.edge(e).weight);
            }
        } else {
            for (const auto& e : g.outEdges(v)) {
                ensureNeighbour(g, result, e.w);
                addWeightedEdge(result, e.w, v, g.edge(e).weight);
            }
        }
    };

    if (nodes) {
        for (const auto& v : *nodes) {
            visit(v);
        }
    } else {
        for (const auto& v : g.nodes()) {
            visit(v);
        }
    }
    return result;
}

std::string LayerGraphBuilder::createRootNode(const LayoutGraph& g) {
    return LayoutUtils::uniqueId(g, "_root");
}

void LayerGraphBuilder::syncOrders(const LayoutGraph& g, LayerGraph& lg) {
    const std::string& root = lg.graph().root;
    for (const auto& v : lg.nodes()) {
        if (v == root) {
            continue;
        }
        LayerNode& label = lg.node(v);
        if (!label.order) {
            continue;
        }
        const NodeLabel* node = g.findNode(v);
        label.order = node ? node->order.value_or(0) : 0;
    }
}

}  // namespace algorithms
}  // namespace strata
