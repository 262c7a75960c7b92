#include "BorderSegments.h"
#include "strata/common/Logger.h"
#include "strata/layout/util/LayoutUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace strata {
namespace algorithms {

namespace {

using BorderList = std::vector<std::optional<std::string>>;

void addBorderNode(LayoutGraph& g, BorderSide side, std::string_view prefix,
                   const std::string& sg, int rank) {
    BorderList& list = side == BorderSide::Left ? g.node(sg).borderLeft : g.node(sg).borderRight;
    std::optional<std::string> prev;
    if (rank >= 1 && static_cast<size_t>(rank - 1) < list.size()) {
        prev = list[rank - 1];
    }

    NodeLabel label;
    label.rank = rank;
    label.borderType = side;
    std::string curr = LayoutUtils::addDummyNode(g, DummyKind::Border, std::move(label), prefix);

    // addDummyNode may have moved the label storage
    BorderList& borders = side == BorderSide::Left ? g.node(sg).borderLeft : g.node(sg).borderRight;
    size_t idx = static_cast<size_t>(std::max(rank, 0));
    if (idx >= borders.size()) {
        borders.resize(idx + 1);
    }
    borders[idx] = curr;

    g.setParent(curr, sg);
    if (prev) {
        EdgeLabel edge;
        edge.weight = 1.0;
        g.setEdge(*prev, curr, edge);
    }
}

void addSegments(LayoutGraph& g, const std::string& v) {
    for (const auto& child : g.children(v)) {
        addSegments(g, child);
    }

    const NodeLabel& node = g.node(v);
    if (!node.minRank || !node.maxRank) {
        return;
    }
    int minRank = *node.minRank;
    int maxRank = *node.maxRank;

    NodeLabel& label = g.node(v);
    size_t size = static_cast<size_t>(std::max(maxRank, 0)) + 1;
    label.borderLeft.assign(size, std::nullopt);
    label.borderRight.assign(size, std::nullopt);

    for (int rank = minRank; rank <= maxRank; ++rank) {
        addBorderNode(g, BorderSide::Left, "_bl", v, rank);
        addBorderNode(g, BorderSide::Right, "_br", v, rank);
    }
}

}  // namespace

void BorderSegments::assignRankMinMax(LayoutGraph& g) {
    for (const auto& v : g.nodes()) {
        NodeLabel& node = g.node(v);
        if (!node.borderTop || !node.borderBottom) {
            continue;
        }
        const NodeLabel* top = g.findNode(*node.borderTop);
        const NodeLabel* bottom = g.findNode(*node.borderBottom);
        if (!top || !bottom || !top->rank || !bottom->rank) {
            LOG_WARN("Subgraph {} has unranked borders", v);
            continue;
        }
        node.minRank = top->rank;
        node.maxRank = bottom->rank;
    }
}

void BorderSegments::add(LayoutGraph& g) {
    if (!g.isCompound()) {
        return;
    }
    for (const auto& v : g.children()) {
        addSegments(g, v);
    }
}

void BorderSegments::removeBorderNodes(LayoutGraph& g) {
    for (const auto& v : g.nodes()) {
        if (!g.hasChildren(v)) {
            continue;
        }
        const NodeLabel& node = g.node(v);
        if (!node.borderTop || !node.borderBottom) {
            continue;
        }
        const NodeLabel* top = g.findNode(*node.borderTop);
        const NodeLabel* bottom = g.findNode(*node.borderBottom);
        if (!top || !bottom || !top->y || !bottom->y) {
            continue;
        }

        double lx = std::numeric_limits<double>::infinity();
        for (const auto& id : node.borderLeft) {
            const NodeLabel* border = id ? g.findNode(*id) : nullptr;
            if (border && border->x) {
                lx = std::min(lx, *border->x);
            }
        }
        double rx = -std::numeric_limits<double>::infinity();
        for (const auto& id : node.borderRight) {
            const NodeLabel* border = id ? g.findNode(*id) : nullptr;
            if (border && border->x) {
                rx = std::max(rx, *border->x);
            }
        }
        if (!std::isfinite(lx) || !std::isfinite(rx)) {
            continue;
        }

        double ty = *top->y;
        double width = std::abs(rx - lx);
        double height = std::abs(*bottom->y - ty);

        NodeLabel& label = g.node(v);
        label.width = width;
        label.height = height;
        label.x = lx + width / 2;
        label.y = ty + height / 2;
    }

    for (const auto& v : g.nodes()) {
        if (g.node(v).dummy == DummyKind::Border) {
            g.removeNode(v);
        }
    }
}

}  // namespace algorithms
}  // namespace strata
