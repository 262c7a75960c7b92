#include "NestingGraph.h"
#include "strata/common/Logger.h"
#include "strata/layout/util/LayoutUtils.h"

#include <algorithm>
#include <unordered_map>

namespace strata {
namespace algorithms {

namespace {

using DepthMap = std::unordered_map<std::string, int>;

struct NestingContext {
    std::string root;
    int nodeSep = 1;
    double weight = 1.0;
    int height = 0;
    DepthMap depths;
};

void collectDepths(const LayoutGraph& g, const std::string& v, int depth, DepthMap& out) {
    for (const auto& child : g.children(v)) {
        collectDepths(g, child, depth + 1, out);
    }
    out[v] = depth;
}

DepthMap treeDepths(const LayoutGraph& g) {
    DepthMap depths;
    for (const auto& v : g.children()) {
        collectDepths(g, v, 1, depths);
    }
    return depths;
}

std::string addBorderNode(LayoutGraph& g, std::string_view prefix) {
    return LayoutUtils::addDummyNode(g, DummyKind::Border, NodeLabel{}, prefix);
}

EdgeLabel nestingLabel(double weight, int minlen) {
    EdgeLabel label;
    label.weight = weight;
    label.minlen = minlen;
    label.nestingEdge = true;
    return label;
}

void dfs(LayoutGraph& g, const NestingContext& ctx, const std::string& v) {
    std::vector<std::string> children = g.children(v);
    if (children.empty()) {
        if (v != ctx.root) {
            EdgeLabel label;
            label.weight = 0.0;
            label.minlen = ctx.nodeSep;
            g.setEdge(ctx.root, v, label);
        }
        return;
    }

    std::string top = addBorderNode(g, "_bt");
    std::string bottom = addBorderNode(g, "_bb");
    g.setParent(top, v);
    g.setParent(bottom, v);
    g.node(v).borderTop = top;
    g.node(v).borderBottom = bottom;

    int depth = ctx.depths.count(v) ? ctx.depths.at(v) : 1;

    for (const auto& child : children) {
        dfs(g, ctx, child);

        const NodeLabel& childNode = g.node(child);
        std::string childTop = childNode.borderTop.value_or(child);
        std::string childBottom = childNode.borderBottom.value_or(child);
        double thisWeight = childNode.borderTop ? ctx.weight : 2 * ctx.weight;
        int minlen = childTop != childBottom ? 1 : ctx.height - depth + 1;

        g.setEdge(top, childTop, nestingLabel(thisWeight, minlen));
        g.setEdge(childBottom, bottom, nestingLabel(thisWeight, minlen));
    }

    if (!g.parent(v)) {
        g.setEdge(ctx.root, top, nestingLabel(0.0, ctx.height + depth));
    }
}

}  // namespace

void NestingGraph::run(LayoutGraph& g) {
    NestingContext ctx;
    ctx.root = LayoutUtils::addDummyNode(g, DummyKind::Root, NodeLabel{}, "_root");
    ctx.depths = treeDepths(g);

    int maxDepth = 1;
    for (const auto& [v, depth] : ctx.depths) {
        maxDepth = std::max(maxDepth, depth);
    }
    ctx.height = maxDepth - 1;
    ctx.nodeSep = 2 * ctx.height + 1;

    g.graph().nestingRoot = ctx.root;

    double weightSum = 0.0;
    for (const auto& e : g.edges()) {
        EdgeLabel& label = g.edge(e);
        label.minlen *= ctx.nodeSep;
        weightSum += label.weight;
    }
    ctx.weight = weightSum + 1;

    for (const auto& child : g.children()) {
        dfs(g, ctx, child);
    }

    g.graph().nodeRankFactor = ctx.nodeSep;

    LOG_DEBUG("Nesting graph: height={}, nodeSep={}", ctx.height, ctx.nodeSep);
}

void NestingGraph::cleanup(LayoutGraph& g) {
    GraphLabel& graphLabel = g.graph();
    if (graphLabel.nestingRoot) {
        g.removeNode(*graphLabel.nestingRoot);
        graphLabel.nestingRoot.reset();
    }

    for (const auto& e : g.edges()) {
        if (g.edge(e).nestingEdge) {
            g.removeEdge(e);
        }
    }
}

}  // namespace algorithms
}  // namespace strata
