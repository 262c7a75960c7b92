#include "Normalize.h"
#include "strata/common/Logger.h"
#include "strata/layout/util/LayoutUtils.h"

namespace strata {
namespace algorithms {

namespace {

void normalizeEdge(LayoutGraph& g, const EdgeKey& e) {
    int vRank = g.node(e.v).rank.value_or(0);
    int wRank = g.node(e.w).rank.value_or(0);
    if (wRank == vRank + 1) {
        return;
    }

    EdgeLabel edgeLabel = g.edge(e);
    g.removeEdge(e);
    edgeLabel.points.clear();

    std::string prev = e.v;
    bool first = true;
    for (int r = vRank + 1; r < wRank; ++r) {
        NodeLabel attrs;
        attrs.rank = r;
        attrs.edgeLabel = edgeLabel;
        attrs.edgeObj = e;
        DummyKind kind = DummyKind::Edge;
        if (edgeLabel.labelRank && *edgeLabel.labelRank == r) {
            attrs.width = edgeLabel.width;
            attrs.height = edgeLabel.height;
            attrs.labelpos = edgeLabel.labelpos;
            kind = DummyKind::EdgeLabel;
        }
        std::string dummy = LayoutUtils::addDummyNode(g, kind, std::move(attrs), "_d");
        if (first) {
            g.graph().dummyChains.push_back(dummy);
            first = false;
        }

        EdgeLabel segment;
        segment.weight = edgeLabel.weight;
        g.setEdge(prev, dummy, segment, e.name);
        prev = std::move(dummy);
    }

    EdgeLabel segment;
    segment.weight = edgeLabel.weight;
    g.setEdge(prev, e.w, segment, e.name);
}

}  // namespace

void Normalize::run(LayoutGraph& g) {
    g.graph().dummyChains.clear();
    for (const auto& e : g.edges()) {
        normalizeEdge(g, e);
    }
    LOG_DEBUG("Normalized {} long edges", g.graph().dummyChains.size());
}

void Normalize::undo(LayoutGraph& g) {
    for (const auto& start : g.graph().dummyChains) {
        const NodeLabel* head = g.findNode(start);
        if (!head || !head->edgeLabel || !head->edgeObj) {
            LOG_WARN("Dummy chain {} lost its head node", start);
            continue;
        }
        EdgeLabel origLabel = *head->edgeLabel;
        EdgeKey edgeObj = *head->edgeObj;

        std::string v = start;
        while (const NodeLabel* node = g.findNode(v)) {
            if (!node->isDummy()) {
                break;
            }
            if (node->x && node->y) {
                origLabel.points.emplace_back(*node->x, *node->y);
                if (node->dummy == DummyKind::EdgeLabel) {
                    origLabel.x = node->x;
                    origLabel.y = node->y;
                    origLabel.width = node->width;
                    origLabel.height = node->height;
                }
            }

            std::vector<std::string> next = g.successors(v);
            g.removeNode(v);
            if (next.empty()) {
                break;
            }
            v = next.front();
        }

        g.setEdge(edgeObj, std::move(origLabel));
    }
}

}  // namespace algorithms
}  // namespace strata
