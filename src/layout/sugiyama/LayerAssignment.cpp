#include "LayerAssignment.h"
#include "NetworkSimplex.h"
#include "strata/common/Logger.h"

#include <algorithm>
#include <limits>
#include <unordered_set>

namespace strata {
namespace algorithms {

namespace {

int longestPathDfs(LayoutGraph& g, const std::string& v, std::unordered_set<std::string>& visited) {
    NodeLabel& label = g.node(v);
    if (!visited.insert(v).second) {
        return label.rank.value_or(0);
    }

    std::optional<int> rank;
    for (const auto& e : g.outEdges(v)) {
        int candidate = longestPathDfs(g, e.w, visited) - g.edge(e).minlen;
        rank = rank ? std::min(*rank, candidate) : candidate;
    }
    g.node(v).rank = rank.value_or(0);
    return *g.node(v).rank;
}

}  // namespace

void Ranking::longestPath(LayoutGraph& g) {
    std::unordered_set<std::string> visited;
    for (const auto& v : g.sources()) {
        longestPathDfs(g, v, visited);
    }
}

int Ranking::slack(const LayoutGraph& g, const EdgeKey& e) {
    const NodeLabel* v = g.findNode(e.v);
    const NodeLabel* w = g.findNode(e.w);
    const EdgeLabel* label = g.findEdge(e);
    int vRank = v ? v->rank.value_or(0) : 0;
    int wRank = w ? w->rank.value_or(0) : 0;
    int minlen = label ? label->minlen : 1;
    return wRank - vRank - minlen;
}

TreeGraph Ranking::feasibleTree(LayoutGraph& g) {
    TreeGraph t(GraphOptions{false, false, false});

    std::vector<std::string> nodes = g.nodes();
    if (nodes.empty()) {
        return t;
    }
    const size_t size = g.nodeCount();
    t.setNode(nodes.front());

    while (tightTree(t, g) < size) {
        std::optional<EdgeKey> best;
        int bestSlack = std::numeric_limits<int>::max();
        for (const auto& e : g.edges()) {
            if (t.hasNode(e.v) == t.hasNode(e.w)) {
                continue;
            }
            int s = slack(g, e);
            if (s < bestSlack) {
                bestSlack = s;
                best = e;
            }
        }

        if (!best) {
            // Nothing leaves the tree: start the next component.
            auto next = std::find_if(nodes.begin(), nodes.end(),
                                     [&](const std::string& v) { return !t.hasNode(v); });
            if (next == nodes.end()) {
                break;
            }
            t.setNode(*next);
            continue;
        }

        int delta = t.hasNode(best->v) ? bestSlack : -bestSlack;
        for (const auto& v : t.nodes()) {
            NodeLabel& label = g.node(v);
            label.rank = label.rank.value_or(0) + delta;
        }
    }
    return t;
}

size_t Ranking::tightTree(TreeGraph& t, const LayoutGraph& g) {
    for (const auto& v : t.nodes()) {
        tightTreeDfs(t, g, v);
    }
    return t.nodeCount();
}

void Ranking::tightTreeDfs(TreeGraph& t, const LayoutGraph& g, const std::string& v) {
    for (const auto& e : g.nodeEdges(v)) {
        const std::string& w = (v == e.v) ? e.w : e.v;
        if (!t.hasNode(w) && slack(g, e) == 0) {
            t.setNode(w);
            t.setEdge(v, w);
            tightTreeDfs(t, g, w);
        }
    }
}

LayerAssignmentResult Ranking::summarize(const LayoutGraph& g) {
    LayerAssignmentResult result;
    int minRank = std::numeric_limits<int>::max();
    int maxRank = std::numeric_limits<int>::min();
    for (const auto& v : g.nodes()) {
        if (auto rank = g.node(v).rank) {
            minRank = std::min(minRank, *rank);
            maxRank = std::max(maxRank, *rank);
            ++result.rankedNodes;
        }
    }
    if (result.rankedNodes > 0) {
        result.minRank = minRank;
        result.maxRank = maxRank;
    }
    return result;
}

LayerAssignmentResult LongestPathLayerAssignment::assignLayers(LayoutGraph& graph) const {
    Ranking::longestPath(graph);
    return Ranking::summarize(graph);
}

LayerAssignmentResult TightTreeLayerAssignment::assignLayers(LayoutGraph& graph) const {
    Ranking::longestPath(graph);
    Ranking::feasibleTree(graph);
    return Ranking::summarize(graph);
}

LayerAssignmentResult NetworkSimplexLayerAssignment::assignLayers(LayoutGraph& graph) const {
    NetworkSimplex::run(graph);
    return Ranking::summarize(graph);
}

LayerAssignmentResult PresetLayerAssignment::assignLayers(LayoutGraph& graph) const {
    return Ranking::summarize(graph);
}

std::unique_ptr<ILayerAssignment> makeLayerAssignment(RankingStrategy strategy) {
    switch (strategy) {
        case RankingStrategy::NetworkSimplex:
            return std::make_unique<NetworkSimplexLayerAssignment>();
        case RankingStrategy::TightTree:
            return std::make_unique<TightTreeLayerAssignment>();
        case RankingStrategy::LongestPath:
            return std::make_unique<LongestPathLayerAssignment>();
        case RankingStrategy::None:
            return std::make_unique<PresetLayerAssignment>();
    }
    LOG_WARN("Unknown ranking strategy, using network simplex");
    return std::make_unique<NetworkSimplexLayerAssignment>();
}

}  // namespace algorithms
}  // namespace strata
