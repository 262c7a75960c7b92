#include "SelfEdges.h"
#include "strata/common/Logger.h"
#include "strata/layout/util/LayoutUtils.h"

namespace strata {
namespace algorithms {

void SelfEdges::remove(LayoutGraph& g) {
    size_t removed = 0;
    for (const auto& e : g.edges()) {
        if (e.v != e.w) {
            continue;
        }
        g.node(e.v).selfEdges.push_back(SelfEdge{e, g.edge(e)});
        g.removeEdge(e);
        ++removed;
    }
    if (removed > 0) {
        LOG_DEBUG("Set aside {} self-loops", removed);
    }
}

void SelfEdges::insert(LayoutGraph& g) {
    Layering layering = LayoutUtils::buildLayerMatrix(g);
    for (const auto& layer : layering) {
        int extra = 0;
        for (size_t idx = 0; idx < layer.size(); ++idx) {
            const std::string& v = layer[idx];
            NodeLabel& node = g.node(v);
            node.order = static_cast<int>(idx) + extra;

            std::vector<SelfEdge> selfEdges = std::move(node.selfEdges);
            node.selfEdges.clear();
            int rank = node.rank.value_or(0);

            for (auto& selfEdge : selfEdges) {
                ++extra;
                NodeLabel placeholder(selfEdge.label.width, selfEdge.label.height);
                placeholder.rank = rank;
                placeholder.order = static_cast<int>(idx) + extra;
                placeholder.edgeObj = selfEdge.edgeObj;
                placeholder.edgeLabel = std::move(selfEdge.label);
                LayoutUtils::addDummyNode(g, DummyKind::SelfEdge, std::move(placeholder), "_se");
            }
        }
    }
}

void SelfEdges::position(LayoutGraph& g) {
    for (const auto& v : g.nodes()) {
        const NodeLabel& node = g.node(v);
        if (node.dummy != DummyKind::SelfEdge) {
            continue;
        }
        if (!node.edgeObj || !node.edgeLabel) {
            LOG_WARN("Self-loop placeholder {} has no edge, dropped", v);
            g.removeNode(v);
            continue;
        }

        EdgeKey edgeObj = *node.edgeObj;
        EdgeLabel label = *node.edgeLabel;
        double x = node.x.value_or(0.0);
        double y = node.y.value_or(0.0);

        const NodeLabel* selfNode = g.findNode(edgeObj.v);
        if (!selfNode) {
            LOG_WARN("Self-loop placeholder {} lost node {}", v, edgeObj.v);
            g.removeNode(v);
            continue;
        }
        double i = selfNode->x.value_or(0.0) + selfNode->width / 2;
        double a = selfNode->y.value_or(0.0);
        double o = x - i;
        double l = selfNode->height / 2;

        label.points = {
            {i + 2 * o / 3, a - l},
            {i + 5 * o / 6, a - l},
            {i + o, a},
            {i + 5 * o / 6, a + l},
            {i + 2 * o / 3, a + l},
        };
        label.x = x;
        label.y = y;

        g.setEdge(edgeObj, std::move(label));
        g.removeNode(v);
    }
}

}  // namespace algorithms
}  // namespace strata
