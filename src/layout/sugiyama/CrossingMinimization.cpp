#include "CrossingMinimization.h"
#include "strata/common/Logger.h"
#include "strata/layout/util/LayoutUtils.h"

#include <algorithm>
#include <limits>
#include <map>
#include <unordered_map>
#include <unordered_set>

namespace strata {
namespace algorithms {

namespace {

double twoLayerCrossCount(const LayoutGraph& g, const std::vector<std::string>& north,
                          const std::vector<std::string>& south) {
    std::unordered_map<std::string, size_t> southPos;
    for (size_t i = 0; i < south.size(); ++i) {
        southPos.emplace(south[i], i);
    }

    struct Entry {
        size_t pos;
        double weight;
    };
    std::vector<Entry> southEntries;
    for (const auto& v : north) {
        std::vector<Entry> entries;
        for (const auto& e : g.outEdges(v)) {
            auto it = southPos.find(e.w);
            if (it != southPos.end()) {
                entries.push_back({it->second, g.edge(e).weight});
            }
        }
        std::stable_sort(entries.begin(), entries.end(),
                         [](const Entry& a, const Entry& b) { return a.pos < b.pos; });
        southEntries.insert(southEntries.end(), entries.begin(), entries.end());
    }

    size_t firstIndex = 1;
    while (firstIndex < south.size()) {
        firstIndex <<= 1;
    }
    std::vector<double> tree(2 * firstIndex - 1, 0.0);
    firstIndex -= 1;

    double cc = 0.0;
    for (const auto& entry : southEntries) {
        size_t index = entry.pos + firstIndex;
        tree[index] += entry.weight;
        double weightSum = 0.0;
        while (index > 0) {
            if (index % 2 == 1) {
                weightSum += tree[index + 1];
            }
            index = (index - 1) >> 1;
            tree[index] += entry.weight;
        }
        cc += entry.weight * weightSum;
    }
    return cc;
}

std::map<int, std::vector<std::string>> nodesByRank(const LayoutGraph& g) {
    std::map<int, std::vector<std::string>> byRank;
    for (const auto& v : g.nodes()) {
        const NodeLabel& node = g.node(v);
        if (node.rank) {
            byRank[*node.rank].push_back(v);
        }
        if (node.minRank && node.maxRank) {
            for (int r = *node.minRank; r <= *node.maxRank; ++r) {
                if (!node.rank || r != *node.rank) {
                    byRank[r].push_back(v);
                }
            }
        }
    }
    return byRank;
}

}  // namespace

Layering Ordering::initOrder(const LayoutGraph& g) {
    std::vector<std::string> simpleNodes;
    int maxRank = -1;
    for (const auto& v : g.nodes()) {
        if (g.hasChildren(v)) {
            continue;
        }
        const NodeLabel& node = g.node(v);
        if (!node.rank) {
            LOG_WARN("Node {} has no rank, left out of the initial order", v);
            continue;
        }
        simpleNodes.push_back(v);
        maxRank = std::max(maxRank, *node.rank);
    }

    Layering layers(static_cast<size_t>(maxRank + 1));
    if (simpleNodes.empty()) {
        return layers;
    }

    std::stable_sort(simpleNodes.begin(), simpleNodes.end(),
                     [&g](const std::string& a, const std::string& b) {
                         return *g.node(a).rank < *g.node(b).rank;
                     });

    std::unordered_set<std::string> visited;
    std::vector<std::string> stack;
    for (const auto& start : simpleNodes) {
        stack.push_back(start);
        while (!stack.empty()) {
            std::string v = std::move(stack.back());
            stack.pop_back();
            if (!visited.insert(v).second) {
                continue;
            }
            const NodeLabel& node = g.node(v);
            if (node.rank && *node.rank >= 0 && *node.rank <= maxRank) {
                layers[static_cast<size_t>(*node.rank)].push_back(v);
            }
            std::vector<std::string> succ = g.successors(v);
            for (auto it = succ.rbegin(); it != succ.rend(); ++it) {
                if (!visited.count(*it)) {
                    stack.push_back(*it);
                }
            }
        }
    }
    return layers;
}

void Ordering::assignOrder(LayoutGraph& g, const Layering& layering) {
    for (const auto& layer : layering) {
        for (size_t i = 0; i < layer.size(); ++i) {
            g.node(layer[i]).order = static_cast<int>(i);
        }
    }
}

double Ordering::crossCount(const LayoutGraph& g,
                            const Layering& layering) {
    double cc = 0.0;
    for (size_t i = 1; i < layering.size(); ++i) {
        cc += twoLayerCrossCount(g, layering[i - 1], layering[i]);
    }
    return cc;
}

void Ordering::addSubgraphConstraints(const LayerGraph& lg, ConstraintGraph& cg,
                                      const std::vector<std::string>& vs) {
    std::unordered_map<std::string, std::string> prev;
    std::optional<std::string> rootPrev;

    for (const auto& v : vs) {
        std::optional<std::string> child = lg.parent(v);
        while (child) {
            std::optional<std::string> parent = lg.parent(*child);
            std::optional<std::string> prevChild;
            if (parent) {
                auto it = prev.find(*parent);
                if (it != prev.end()) {
                    prevChild = it->second;
                }
                prev[*parent] = *child;
            } else {
                prevChild = rootPrev;
                rootPrev = *child;
            }
            if (prevChild && *prevChild != *child) {
                cg.setNode(*prevChild);
                cg.setNode(*child);
                cg.setEdge(*prevChild, *child);
                break;
            }
            child = parent;
        }
    }
}

void Ordering::sweep(LayoutGraph& g, std::vector<LayerGraph>& layerGraphs, bool biasRight) {
    ConstraintGraph cg;
    for (auto& lg : layerGraphs) {
        LayerGraphBuilder::syncOrders(g, lg);
        SortResult sorted = Barycenter::sortSubgraph(lg, lg.graph().root, cg, biasRight);
        for (size_t i = 0; i < sorted.vs.size(); ++i) {
            g.node(sorted.vs[i]).order = static_cast<int>(i);
        }
        addSubgraphConstraints(lg, cg, sorted.vs);
    }
}

std::vector<LayerGraph> Ordering::buildLayerGraphs(const LayoutGraph& g,
                                                   const std::vector<int>& ranks,
                                                   Relationship relationship) {
    std::map<int, std::vector<std::string>> byRank = nodesByRank(g);
    std::string root = LayerGraphBuilder::createRootNode(g);
    static const std::vector<std::string> kNone;

    std::vector<LayerGraph> result;
    result.reserve(ranks.size());
    for (int rank : ranks) {
        auto it = byRank.find(rank);
        result.push_back(LayerGraphBuilder::build(g, rank, relationship, root,
                                                  it != byRank.end() ? &it->second : &kNone));
    }
    return result;
}

CrossingMinimizationResult Ordering::order(LayoutGraph& g) {
    CrossingMinimizationResult result;
    std::optional<int> maxRank = LayoutUtils::maxRank(g);
    if (!maxRank) {
        return result;
    }

    Layering initial = initOrder(g);
    assignOrder(g, initial);
    double initialCC = crossCount(g, initial);

    std::vector<int> downRanks;
    for (int r = 1; r <= *maxRank; ++r) {
        downRanks.push_back(r);
    }
    std::vector<int> upRanks;
    for (int r = *maxRank - 1; r >= 0; --r) {
        upRanks.push_back(r);
    }
    std::vector<LayerGraph> downLayerGraphs = buildLayerGraphs(g, downRanks, Relationship::InEdges);
    std::vector<LayerGraph> upLayerGraphs = buildLayerGraphs(g, upRanks, Relationship::OutEdges);

    double bestCC = std::numeric_limits<double>::infinity();
    Layering best;

    int i = 0;
    for (int lastBest = 0; lastBest < kMaxSweepsWithoutImprovement; ++i, ++lastBest) {
        sweep(g, i % 2 == 1 ? downLayerGraphs : upLayerGraphs, i % 4 >= 2);

        Layering layering = LayoutUtils::buildLayerMatrix(g);
        double cc = crossCount(g, layering);
        LOG_DEBUG("Sweep {} ({}): {} crossings", i, i % 2 == 1 ? "down" : "up", cc);
        if (cc < bestCC) {
            lastBest = 0;
            best = std::move(layering);
            bestCC = cc;
        }
    }

    // The sweeps can end worse than the DFS layering they started from
    if (initialCC < bestCC) {
        LOG_DEBUG("Sweeps ended at {} crossings, keeping the initial layering ({})", bestCC,
                  initialCC);
        best = std::move(initial);
        bestCC = initialCC;
    }

    assignOrder(g, best);
    result.crossings = bestCC;
    result.sweeps = i;
    return result;
}

CrossingMinimizationResult BarycenterCrossingMinimization::minimize(LayoutGraph& graph) const {
    CrossingMinimizationResult result = Ordering::order(graph);
    LOG_DEBUG("{}: {} crossings after {} sweeps", algorithmName(), result.crossings, result.sweeps);
    return result;
}

double BarycenterCrossingMinimization::countCrossings(
    const LayoutGraph& graph, const Layering& layering) const {
    return Ordering::crossCount(graph, layering);
}

}  // namespace algorithms
}  // namespace strata
