#include "strata/layout/util/LayoutUtils.h"
#include "strata/common/Logger.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

namespace strata {

Point LayoutUtils::intersectRect(const Rect& box, const Point& point) {
    Point c = box.center();
    double dx = point.x - c.x;
    double dy = point.y - c.y;
    double w = box.width / 2;
    double h = box.height / 2;

    if (dx == 0 && dy == 0) {
        return {c.x + w, c.y};
    }

    double sx;
    double sy;
    if (std::abs(dy) * w > std::abs(dx) * h) {
        // Leaves through the top or bottom side
        if (dy < 0) {
            h = -h;
        }
        sx = h * dx / dy;
        sy = h;
    } else {
        if (dx < 0) {
            w = -w;
        }
        sx = w;
        sy = w * dy / dx;
    }
    return {c.x + sx, c.y + sy};
}

Rect LayoutUtils::nodeBox(const NodeLabel& node) {
    return Rect::fromCenter({node.x.value_or(0.0), node.y.value_or(0.0)},
                            {node.width, node.height});
}

Layering LayoutUtils::buildLayerMatrix(const LayoutGraph& g) {
    int minRank = std::numeric_limits<int>::max();
    int maxRank = std::numeric_limits<int>::min();
    struct Entry {
        int rank;
        int order;
        std::string id;
    };
    std::vector<Entry> entries;

    for (const auto& v : g.nodes()) {
        const NodeLabel& node = g.node(v);
        if (!node.rank) {
            continue;
        }
        minRank = std::min(minRank, *node.rank);
        maxRank = std::max(maxRank, *node.rank);
        entries.push_back({*node.rank, node.order.value_or(0), v});
    }
    if (entries.empty()) {
        return {};
    }

    int shift = minRank < 0 ? -minRank : 0;
    std::vector<std::vector<std::pair<int, std::string>>> layers(maxRank + shift + 1);
    for (auto& e : entries) {
        layers[e.rank + shift].emplace_back(e.order, std::move(e.id));
    }

    Layering result;
    result.reserve(layers.size());
    for (auto& layer : layers) {
        std::stable_sort(layer.begin(), layer.end(),
                         [](const auto& a, const auto& b) { return a.first < b.first; });
        std::vector<std::string> ids;
        ids.reserve(layer.size());
        for (auto& [order, id] : layer) {
            ids.push_back(std::move(id));
        }
        result.push_back(std::move(ids));
    }
    return result;
}

void LayoutUtils::normalizeRanks(LayoutGraph& g) {
    std::vector<std::string> nodes = g.nodes();
    int minRank = std::numeric_limits<int>::max();
    for (const auto& v : nodes) {
        if (auto rank = g.node(v).rank) {
            minRank = std::min(minRank, *rank);
        }
    }
    if (minRank == std::numeric_limits<int>::max()) {
        return;
    }
    for (const auto& v : nodes) {
        NodeLabel& node = g.node(v);
        if (node.rank) {
            *node.rank -= minRank;
        }
    }
}

void LayoutUtils::removeEmptyRanks(LayoutGraph& g) {
    std::optional<int> factor = g.graph().nodeRankFactor;
    if (!factor || *factor <= 0) {
        return;
    }

    std::vector<std::string> nodes = g.nodes();
    int offset = std::numeric_limits<int>::max();
    for (const auto& v : nodes) {
        if (auto rank = g.node(v).rank) {
            offset = std::min(offset, *rank);
        }
    }
    if (offset == std::numeric_limits<int>::max()) {
        return;
    }

    std::map<int, std::vector<std::string>> layers;
    int maxIndex = 0;
    for (const auto& v : nodes) {
        if (auto rank = g.node(v).rank) {
            int idx = *rank - offset;
            maxIndex = std::max(maxIndex, idx);
            layers[idx].push_back(v);
        }
    }

    int delta = 0;
    int removed = 0;
    for (int i = 0; i <= maxIndex; ++i) {
        auto it = layers.find(i);
        if (it == layers.end()) {
            if (i % *factor != 0) {
                --delta;
                ++removed;
            }
            continue;
        }
        if (delta != 0) {
            for (const auto& v : it->second) {
                *g.node(v).rank += delta;
            }
        }
    }
    LOG_DEBUG("Removed {} empty ranks (factor {})", removed, *factor);
}

std::optional<int> LayoutUtils::maxRank(const LayoutGraph& g) {
    std::optional<int> result;
    for (const auto& v : g.nodes()) {
        if (auto rank = g.node(v).rank) {
            result = result ? std::max(*result, *rank) : *rank;
        }
    }
    return result;
}

std::string LayoutUtils::addDummyNode(LayoutGraph& g, DummyKind kind, NodeLabel label,
                                      std::string_view prefix) {
    std::string v = uniqueId(g, prefix);
    label.dummy = kind;
    g.setNode(v, std::move(label));
    return v;
}

LayoutGraph LayoutUtils::asNonCompoundGraph(const LayoutGraph& g) {
    LayoutGraph result(GraphOptions{true, g.isMultigraph(), false});
    result.setGraph(g.graph());

    for (const auto& v : g.nodes()) {
        if (!g.hasChildren(v)) {
            result.setNode(v, g.node(v));
        }
    }
    for (const auto& e : g.edges()) {
        if (!result.hasNode(e.v) || !result.hasNode(e.w)) {
            LOG_WARN("Edge {} -> {} touches a compound node, ignored for ranking", e.v, e.w);
            continue;
        }
        result.setEdge(e, g.edge(e));
    }
    return result;
}

LayoutGraph LayoutUtils::simplify(const LayoutGraph& g) {
    LayoutGraph result(GraphOptions{true, false, false});
    result.setGraph(g.graph());

    for (const auto& v : g.nodes()) {
        result.setNode(v, g.node(v));
    }
    for (const auto& e : g.edges()) {
        const EdgeLabel& label = g.edge(e);
        EdgeLabel merged;
        merged.weight = 0.0;
        merged.minlen = 1;
        if (const EdgeLabel* existing = result.findEdge(e.v, e.w)) {
            merged.weight = existing->weight;
            merged.minlen = existing->minlen;
        }
        merged.weight += label.weight;
        merged.minlen = std::max(merged.minlen, label.minlen);
        result.setEdge(e.v, e.w, merged);
    }
    return result;
}

}  // namespace strata
