#include "CycleRemoval.h"
#include "strata/common/Logger.h"

#include <algorithm>

namespace strata {
namespace algorithms {

CycleRemoval::Result CycleRemoval::findEdgesToReverse(const LayoutGraph& graph) const {
    Result result;

    std::unordered_set<std::string> visited;
    std::unordered_set<std::string> onStack;
    for (const auto& node : graph.nodes()) {
        dfs(node, graph, visited, onStack, result.reversedEdges);
    }

    result.isAcyclic = result.reversedEdges.empty();
    return result;
}

bool CycleRemoval::hasCycles(const LayoutGraph& graph) const {
    return !findEdgesToReverse(graph).isAcyclic;
}

void CycleRemoval::dfs(const std::string& node, const LayoutGraph& graph,
                       std::unordered_set<std::string>& visited,
                       std::unordered_set<std::string>& onStack,
                       std::vector<EdgeKey>& backEdges) const {
    if (!visited.insert(node).second) {
        return;
    }
    onStack.insert(node);

    for (const auto& e : graph.outEdges(node)) {
        if (e.v == e.w) {
            continue;
        }
        if (onStack.count(e.w)) {
            backEdges.push_back(e);
        } else {
            dfs(e.w, graph, visited, onStack, backEdges);
        }
    }

    onStack.erase(node);
}

size_t Acyclic::run(LayoutGraph& graph, const ICycleRemoval& strategy) {
    CycleRemovalResult fas = strategy.findEdgesToReverse(graph);

    size_t reversed = 0;
    for (const auto& e : fas.reversedEdges) {
        if (e.v == e.w) {
            continue;
        }
        const EdgeLabel* found = graph.findEdge(e);
        if (!found) {
            continue;
        }
        EdgeLabel label = *found;
        graph.removeEdge(e);

        label.forwardName = e.name;
        label.reversed = true;

        std::string name;
        int n = 1;
        do {
            name = "rev" + std::to_string(n++);
        } while (graph.hasEdge(e.w, e.v, name));
        graph.setEdge(e.w, e.v, std::move(label), name);
        ++reversed;
    }

    LOG_DEBUG("{} reversed {} edges", strategy.algorithmName(), reversed);
    return reversed;
}

void Acyclic::undo(LayoutGraph& graph) {
    for (const auto& e : graph.edges()) {
        const EdgeLabel* found = graph.findEdge(e);
        if (!found || !found->reversed) {
            continue;
        }
        EdgeLabel label = *found;
        graph.removeEdge(e);

        std::optional<std::string> name = std::move(label.forwardName);
        label.forwardName.reset();
        label.reversed = false;
        std::reverse(label.points.begin(), label.points.end());
        graph.setEdge(e.w, e.v, std::move(label), std::move(name));
    }
}

}  // namespace algorithms
}  // namespace strata
