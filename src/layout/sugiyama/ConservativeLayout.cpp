#include "ConservativeLayout.h"
#include "strata/common/Logger.h"

#include <algorithm>
#include <deque>
#include <functional>
#include <limits>
#include <optional>

namespace strata {
namespace algorithms {

namespace {

constexpr int kUnbounded = std::numeric_limits<int>::max() / 4;

int effectiveMinlen(const EdgeLabel& label) {
    return std::max(label.minlen, 1);
}

Point labelAnchor(const EdgeLabel& label, Point mid) {
    switch (label.labelpos) {
        case LabelPos::L:
            mid.x -= label.labeloffset + label.width / 2;
            break;
        case LabelPos::R:
            mid.x += label.labeloffset + label.width / 2;
            break;
        case LabelPos::C:
            break;
    }
    return mid;
}

}  // namespace

std::unordered_map<std::string, int> ConservativeLayout::rankLeaves(
    const LayoutGraph& g, const std::vector<std::string>& leaves) {
    std::unordered_map<std::string, size_t> indegree;
    for (const auto& v : leaves) {
        indegree[v] = 0;
    }
    for (const auto& e : g.edges()) {
        if (e.v == e.w) {
            continue;
        }
        auto it = indegree.find(e.w);
        if (it != indegree.end()) {
            ++it->second;
        }
    }

    std::deque<std::string> queue;
    for (const auto& v : leaves) {
        if (indegree[v] == 0) {
            queue.push_back(v);
        }
    }

    std::vector<std::string> topo;
    while (!queue.empty()) {
        std::string n = std::move(queue.front());
        queue.pop_front();
        for (const auto& e : g.outEdges(n)) {
            if (e.v == e.w) {
                continue;
            }
            auto it = indegree.find(e.w);
            if (it != indegree.end() && it->second > 0 && --it->second == 0) {
                queue.push_back(e.w);
            }
        }
        topo.push_back(std::move(n));
    }

    if (topo.size() != leaves.size()) {
        LOG_WARN("Cycle left after cycle removal, ranking {} leaves in insertion order", leaves.size());
        topo = leaves;
    }

    std::unordered_map<std::string, int> rank;
    for (const auto& v : leaves) {
        rank[v] = 0;
    }
    for (const auto& n : topo) {
        int r = rank[n];
        for (const auto& e : g.outEdges(n)) {
            if (e.v == e.w) {
                continue;
            }
            int next = r + effectiveMinlen(g.edge(e));
            int& entry = rank[e.w];
            entry = std::max(entry, next);
        }
    }
    return rank;
}

void ConservativeLayout::compactSubgraphs(const LayoutGraph& g,
                                          std::unordered_map<std::string, int>& rank) {
    for (const auto& parent : g.nodes()) {
        if (!g.hasChildren(parent)) {
            continue;
        }
        std::vector<std::string> targets;
        for (const auto& child : g.children(parent)) {
            if (rank.count(child)) {
                targets.push_back(child);
            }
        }
        if (targets.size() < 2) {
            continue;
        }

        int minNeeded = 0;
        int maxAllowed = kUnbounded;
        for (const auto& child : targets) {
            int minRank = 0;
            for (const auto& e : g.inEdges(child)) {
                auto pred = rank.find(e.v);
                if (pred != rank.end()) {
                    minRank = std::max(minRank, pred->second + effectiveMinlen(g.edge(e)));
                }
            }
            int maxRank = kUnbounded;
            for (const auto& e : g.outEdges(child)) {
                auto succ = rank.find(e.w);
                if (succ != rank.end()) {
                    maxRank = std::min(maxRank, std::max(succ->second - effectiveMinlen(g.edge(e)), 0));
                }
            }
            minNeeded = std::max(minNeeded, minRank);
            maxAllowed = std::min(maxAllowed, maxRank);
        }

        if (minNeeded <= maxAllowed) {
            for (const auto& child : targets) {
                rank[child] = minNeeded;
            }
        }
    }
}

ConservativeLayoutResult ConservativeLayout::run(LayoutGraph& g) {
    ConservativeLayoutResult result;
    const GraphLabel& options = g.graph();

    double maxLabelWidth = 0.0;
    double maxLabelHeight = 0.0;
    for (const auto& e : g.edges()) {
        const EdgeLabel& label = g.edge(e);
        maxLabelWidth = std::max(maxLabelWidth, label.width);
        maxLabelHeight = std::max(maxLabelHeight, label.height);
    }
    double nodeSep = options.isHorizontal() ? std::max(options.nodesep, maxLabelHeight)
                                            : std::max(options.nodesep, maxLabelWidth);
    double rankSep = options.isHorizontal() ? std::max(options.ranksep, maxLabelWidth)
                                            : options.ranksep;

    std::vector<std::string> leaves;
    for (const auto& v : g.nodes()) {
        if (!g.isCompound() || !g.hasChildren(v)) {
            leaves.push_back(v);
        }
    }

    std::unordered_map<std::string, int> rank = rankLeaves(g, leaves);
    if (g.isCompound()) {
        compactSubgraphs(g, rank);
    }

    int maxRank = 0;
    for (const auto& entry : rank) {
        maxRank = std::max(maxRank, entry.second);
    }
    Layering& ranks = result.layering;
    ranks.assign(static_cast<size_t>(maxRank + 1), {});
    for (const auto& v : leaves) {
        ranks[static_cast<size_t>(rank[v])].push_back(v);
    }
    LOG_DEBUG("Conservative layout: {} leaves on {} ranks", leaves.size(), ranks.size());

    // Label room below a rank, for labels of edges spanning exactly one rank
    std::vector<double> gapExtra(ranks.size() - 1, 0.0);
    for (const auto& e : g.edges()) {
        if (e.v == e.w) {
            continue;
        }
        auto vRank = rank.find(e.v);
        auto wRank = rank.find(e.w);
        if (vRank == rank.end() || wRank == rank.end() || wRank->second != vRank->second + 1) {
            continue;
        }
        const EdgeLabel& label = g.edge(e);
        if (label.height <= 0.0) {
            continue;
        }
        auto index = static_cast<size_t>(vRank->second);
        if (index < gapExtra.size()) {
            gapExtra[index] = std::max(gapExtra[index], label.height);
        }
    }

    std::vector<double> rankHeights;
    std::vector<double> rankWidths;
    for (const auto& ids : ranks) {
        double h = 0.0;
        double w = 0.0;
        for (size_t i = 0; i < ids.size(); ++i) {
            const NodeLabel& node = g.node(ids[i]);
            h = std::max(h, node.height);
            w += node.width;
            if (i + 1 < ids.size()) {
                w += nodeSep;
            }
        }
        rankHeights.push_back(h);
        rankWidths.push_back(w);
    }
    double maxRankWidth = 0.0;
    for (double w : rankWidths) {
        maxRankWidth = std::max(maxRankWidth, w);
    }

    double yCursor = 0.0;
    for (size_t r = 0; r < ranks.size(); ++r) {
        double y = yCursor + rankHeights[r] / 2;
        double xCursor = (maxRankWidth - rankWidths[r]) / 2;
        for (size_t i = 0; i < ranks[r].size(); ++i) {
            NodeLabel& node = g.node(ranks[r][i]);
            node.x = xCursor + node.width / 2;
            node.y = y;
            node.rank = static_cast<int>(r);
            node.order = static_cast<int>(i);
            xCursor += node.width + nodeSep;
        }

        yCursor += rankHeights[r];
        if (r + 1 < ranks.size()) {
            yCursor += rankSep + gapExtra[r];
        }
    }

    routeEdges(g);
    applyRankDir(g, leaves, yCursor);
    if (g.isCompound()) {
        sizeSubgraphs(g);
    }
    return result;
}

void ConservativeLayout::routeEdges(LayoutGraph& g) {
    double loopGap = std::max(g.graph().edgesep, 1.0);

    for (const auto& e : g.edges()) {
        const NodeLabel& source = g.node(e.v);
        const NodeLabel& target = g.node(e.w);
        double sx = source.x.value_or(0.0);
        double sy = source.y.value_or(0.0);
        double tx = target.x.value_or(0.0);
        double ty = target.y.value_or(0.0);

        EdgeLabel& label = g.edge(e);
        label.points.clear();
        label.x.reset();
        label.y.reset();

        if (e.v == e.w) {
            double x0 = sx + source.width / 2 + loopGap;
            double x1 = x0 + loopGap;
            double yTop = sy - source.height / 2;
            double yBottom = sy + source.height / 2;
            label.points = {{x0, sy}, {x0, yTop}, {x1, yTop}, {x1, sy},
                            {x1, yBottom}, {x0, yBottom}, {x0, sy}};
            continue;
        }

        Point start{sx, sy + source.height / 2};
        Point end{tx, ty - target.height / 2};
        int count = 2 * effectiveMinlen(label) + 1;
        for (int i = 0; i < count; ++i) {
            double t = static_cast<double>(i) / static_cast<double>(count - 1);
            label.points.push_back(start + (end - start) * t);
        }

        if (label.width > 0.0 || label.height > 0.0) {
            Point anchor = labelAnchor(label, label.points[static_cast<size_t>(count / 2)]);
            label.x = anchor.x;
            label.y = anchor.y;
        }
    }
}

void ConservativeLayout::applyRankDir(LayoutGraph& g, const std::vector<std::string>& leaves,
                                      double totalHeight) {
    Direction rankdir = g.graph().rankdir;
    if (rankdir == Direction::TopToBottom) {
        return;
    }

    // (x, y) in top-to-bottom space to the requested direction
    auto map = [rankdir, totalHeight](double x, double y) -> Point {
        switch (rankdir) {
            case Direction::BottomToTop:
                return {x, totalHeight - y};
            case Direction::LeftToRight:
                return {y, x};
            case Direction::RightToLeft:
                return {totalHeight - y, x};
            case Direction::TopToBottom:
                break;
        }
        return {x, y};
    };

    for (const auto& v : leaves) {
        NodeLabel& node = g.node(v);
        if (!node.x || !node.y) {
            continue;
        }
        Point p = map(*node.x, *node.y);
        node.x = p.x;
        node.y = p.y;
    }
    for (const auto& e : g.edges()) {
        EdgeLabel& label = g.edge(e);
        for (auto& p : label.points) {
            p = map(p.x, p.y);
        }
        if (label.x && label.y) {
            Point p = map(*label.x, *label.y);
            label.x = p.x;
            label.y = p.y;
        }
    }
}

void ConservativeLayout::sizeSubgraphs(LayoutGraph& g) {
    std::function<void(const std::string&)> visit = [&](const std::string& v) {
        std::optional<Rect> box;
        std::optional<int> minRank;
        std::optional<int> maxRank;
        for (const auto& child : g.children(v)) {
            if (g.hasChildren(child)) {
                visit(child);
            }
            const NodeLabel& node = g.node(child);
            std::optional<int> lo = node.minRank ? node.minRank : node.rank;
            std::optional<int> hi = node.maxRank ? node.maxRank : node.rank;
            if (lo) {
                minRank = minRank ? std::min(*minRank, *lo) : *lo;
            }
            if (hi) {
                maxRank = maxRank ? std::max(*maxRank, *hi) : *hi;
            }
            if (node.x && node.y) {
                Rect childBox = Rect::fromCenter({*node.x, *node.y}, {node.width, node.height});
                box = box ? box->united(childBox) : childBox;
            }
        }

        NodeLabel& node = g.node(v);
        node.minRank = minRank;
        node.maxRank = maxRank;
        if (box) {
            Point c = box->center();
            node.x = c.x;
            node.y = c.y;
            node.width = box->width;
            node.height = box->height;
        } else {
            LOG_WARN("Subgraph {} has no positioned member, left unsized", v);
        }
    };

    for (const auto& v : g.children()) {
        if (g.hasChildren(v)) {
            visit(v);
        }
    }
}

}  // namespace algorithms
}  // namespace strata
