#include "CoordinateSystem.h"

#include <utility>

namespace strata {
namespace algorithms {

void CoordinateSystem::adjust(LayoutGraph& g) {
    if (g.graph().isHorizontal()) {
        swapWidthHeight(g);
    }
}

void CoordinateSystem::undo(LayoutGraph& g) {
    Direction rankdir = g.graph().rankdir;
    if (rankdir == Direction::BottomToTop || rankdir == Direction::RightToLeft) {
        reverseY(g);
    }
    if (g.graph().isHorizontal()) {
        swapXY(g);
        swapWidthHeight(g);
    }
}

void CoordinateSystem::swapWidthHeight(LayoutGraph& g) {
    for (const auto& v : g.nodes()) {
        NodeLabel& node = g.node(v);
        std::swap(node.width, node.height);
        // Self-loops parked on the node keep their label box in the same frame
        for (auto& selfEdge : node.selfEdges) {
            std::swap(selfEdge.label.width, selfEdge.label.height);
        }
    }
    for (const auto& e : g.edges()) {
        EdgeLabel& label = g.edge(e);
        std::swap(label.width, label.height);
    }
}

void CoordinateSystem::reverseY(LayoutGraph& g) {
    for (const auto& v : g.nodes()) {
        NodeLabel& node = g.node(v);
        if (node.y) {
            node.y = -*node.y;
        }
    }
    for (const auto& e : g.edges()) {
        EdgeLabel& label = g.edge(e);
        for (auto& p : label.points) {
            p.y = -p.y;
        }
        if (label.y) {
            label.y = -*label.y;
        }
    }
}

void CoordinateSystem::swapXY(LayoutGraph& g) {
    for (const auto& v : g.nodes()) {
        NodeLabel& node = g.node(v);
        if (node.x && node.y) {
            std::swap(node.x, node.y);
        }
    }
    for (const auto& e : g.edges()) {
        EdgeLabel& label = g.edge(e);
        for (auto& p : label.points) {
            std::swap(p.x, p.y);
        }
        if (label.x && label.y) {
            std::swap(label.x, label.y);
        }
    }
}

}  // namespace algorithms
}  // namespace strata
