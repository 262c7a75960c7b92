#include "NetworkSimplex.h"
#include "strata/common/Logger.h"
#include "strata/layout/util/LayoutUtils.h"

namespace strata {
namespace algorithms {

void NetworkSimplex::run(LayoutGraph& g) {
    LayoutGraph simplified = LayoutUtils::simplify(g);
    Ranking::longestPath(simplified);
    TreeGraph tree = Ranking::feasibleTree(simplified);
    initLowLimValues(tree);
    initCutValues(tree, simplified);

    size_t pivots = 0;
    while (auto e = leaveEdge(tree)) {
        EdgeKey f = enterEdge(tree, simplified, *e);
        exchangeEdges(tree, simplified, *e, f);
        ++pivots;
    }
    LOG_DEBUG("Network simplex converged after {} pivots", pivots);

    for (const auto& v : g.nodes()) {
        if (const NodeLabel* ranked = simplified.findNode(v); ranked && ranked->rank) {
            g.node(v).rank = ranked->rank;
        }
    }
}

void NetworkSimplex::initLowLimValues(TreeGraph& tree, const std::optional<std::string>& root) {
    std::unordered_set<std::string> visited;
    int nextLim = 1;
    if (root && tree.hasNode(*root)) {
        nextLim = dfsAssignLowLim(tree, visited, nextLim, *root, std::nullopt);
    }
    for (const auto& v : tree.nodes()) {
        if (!visited.count(v)) {
            nextLim = dfsAssignLowLim(tree, visited, nextLim, v, std::nullopt);
        }
    }
}

int NetworkSimplex::dfsAssignLowLim(TreeGraph& tree, std::unordered_set<std::string>& visited,
                                    int nextLim, const std::string& v,
                                    const std::optional<std::string>& parent) {
    int low = nextLim;
    visited.insert(v);

    for (const auto& w : tree.neighbors(v)) {
        if (!visited.count(w)) {
            nextLim = dfsAssignLowLim(tree, visited, nextLim, w, v);
        }
    }

    TreeNodeLabel& label = tree.node(v);
    label.low = low;
    label.lim = nextLim++;
    label.parent = parent;
    return nextLim;
}

void NetworkSimplex::initCutValues(TreeGraph& tree, const LayoutGraph& g) {
    std::vector<std::string> vs = tree.postorder(tree.nodes());
    if (!vs.empty()) {
        vs.pop_back();
    }
    for (const auto& v : vs) {
        const auto& parent = tree.node(v).parent;
        if (!parent) {
            // Root of a later forest component
            continue;
        }
        double cutvalue = calcCutValue(tree, g, v);
        tree.edge(v, *parent).cutvalue = cutvalue;
    }
}

double NetworkSimplex::calcCutValue(const TreeGraph& tree, const LayoutGraph& g,
                                    const std::string& child) {
    const auto& parent = tree.node(child).parent;
    if (!parent) {
        return 0.0;
    }

    bool childIsTail = true;
    const EdgeLabel* graphEdge = g.findEdge(child, *parent);
    if (!graphEdge) {
        childIsTail = false;
        graphEdge = g.findEdge(*parent, child);
    }
    if (!graphEdge) {
        LOG_WARN("Tree edge {} - {} has no graph edge", child, *parent);
        return 0.0;
    }

    double cutValue = graphEdge->weight;
    for (const auto& e : g.nodeEdges(child)) {
        bool isOutEdge = e.v == child;
        const std::string& other = isOutEdge ? e.w : e.v;
        if (other == *parent) {
            continue;
        }

        bool pointsToHead = isOutEdge == childIsTail;
        double otherWeight = g.edge(e).weight;
        cutValue += pointsToHead ? otherWeight : -otherWeight;

        if (const TreeEdgeLabel* treeEdge = tree.findEdge(child, other)) {
            double otherCutValue = treeEdge->cutvalue;
            cutValue += pointsToHead ? -otherCutValue : otherCutValue;
        }
    }
    return cutValue;
}

std::optional<EdgeKey> NetworkSimplex::leaveEdge(const TreeGraph& tree) {
    for (const auto& e : tree.edges()) {
        if (tree.edge(e).cutvalue < 0) {
            return e;
        }
    }
    return std::nullopt;
}

EdgeKey NetworkSimplex::enterEdge(const TreeGraph& tree, const LayoutGraph& g, const EdgeKey& edge) {
    std::string v = edge.v;
    std::string w = edge.w;
    // Tree edges are undirected; orient this one like its graph edge.
    if (!g.hasEdge(v, w)) {
        std::swap(v, w);
    }

    const TreeNodeLabel& vLabel = tree.node(v);
    const TreeNodeLabel& wLabel = tree.node(w);
    const TreeNodeLabel* tailLabel = &vLabel;
    bool flip = false;
    if (vLabel.lim > wLabel.lim) {
        tailLabel = &wLabel;
        flip = true;
    }

    std::optional<EdgeKey> best;
    int bestSlack = 0;
    for (const auto& candidate : g.edges()) {
        const TreeNodeLabel* cv = tree.findNode(candidate.v);
        const TreeNodeLabel* cw = tree.findNode(candidate.w);
        if (!cv || !cw) {
            continue;
        }
        if (flip != isDescendant(*cv, *tailLabel) || flip == isDescendant(*cw, *tailLabel)) {
            continue;
        }
        int s = Ranking::slack(g, candidate);
        if (!best || s < bestSlack) {
            best = candidate;
            bestSlack = s;
        }
    }

    if (!best) {
        LOG_WARN("No entering edge for {} - {}", edge.v, edge.w);
        return edge;
    }
    return *best;
}

void NetworkSimplex::exchangeEdges(TreeGraph& tree, LayoutGraph& g, const EdgeKey& e,
                                   const EdgeKey& f) {
    tree.removeEdge(e.v, e.w);
    tree.setEdge(f.v, f.w);
    initLowLimValues(tree);
    initCutValues(tree, g);
    updateRanks(tree, g);
}

void NetworkSimplex::updateRanks(const TreeGraph& tree, LayoutGraph& g) {
    std::vector<std::string> roots;
    for (const auto& v : tree.nodes()) {
        if (!tree.node(v).parent) {
            roots.push_back(v);
        }
    }

    for (const auto& root : roots) {
        std::vector<std::string> vs = tree.preorder({root});
        for (size_t i = 1; i < vs.size(); ++i) {
            const std::string& v = vs[i];
            const auto& parent = tree.node(v).parent;
            if (!parent) {
                continue;
            }

            bool flipped = false;
            const EdgeLabel* edge = g.findEdge(v, *parent);
            if (!edge) {
                edge = g.findEdge(*parent, v);
                flipped = true;
            }
            if (!edge) {
                continue;
            }
            int parentRank = g.node(*parent).rank.value_or(0);
            g.node(v).rank = parentRank + (flipped ? edge->minlen : -edge->minlen);
        }
    }
}

}  // namespace algorithms
}  // namespace strata
