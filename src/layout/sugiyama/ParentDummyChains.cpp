#include "ParentDummyChains.h"
#include "strata/common/Logger.h"

#include <algorithm>
#include <unordered_map>

namespace strata {
namespace algorithms {

namespace {

struct PostorderNum {
    int low = 0;
    int lim = 0;
};

using PostorderMap = std::unordered_map<std::string, PostorderNum>;

struct PathData {
    std::vector<std::optional<std::string>> path;
    std::optional<std::string> lca;
};

void numberSubtree(const LayoutGraph& g, const std::string& v, int& lim, PostorderMap& result) {
    int low = lim;
    for (const auto& child : g.children(v)) {
        numberSubtree(g, child, lim, result);
    }
    result[v] = {low, lim++};
}

PostorderMap postorder(const LayoutGraph& g) {
    PostorderMap result;
    int lim = 0;
    for (const auto& v : g.children()) {
        numberSubtree(g, v, lim, result);
    }
    return result;
}

/// Subgraphs between v and w: up from v to their lowest common ancestor, then
/// down to w. A nullopt entry stands for the top level.
PathData findPath(const LayoutGraph& g, const PostorderMap& nums, const std::string& v,
                  const std::string& w) {
    const PostorderNum& vNum = nums.at(v);
    const PostorderNum& wNum = nums.at(w);
    int low = std::min(vNum.low, wNum.low);
    int lim = std::max(vNum.lim, wNum.lim);

    PathData data;
    std::optional<std::string> parent = v;
    do {
        parent = g.parent(*parent);
        data.path.push_back(parent);
    } while (parent && (nums.at(*parent).low > low || lim > nums.at(*parent).lim));
    data.lca = parent;

    std::vector<std::optional<std::string>> wPath;
    std::string current = w;
    while (true) {
        std::optional<std::string> p = g.parent(current);
        if (p == data.lca || !p) {
            break;
        }
        wPath.push_back(p);
        current = *p;
    }

    data.path.insert(data.path.end(), wPath.rbegin(), wPath.rend());
    return data;
}

std::optional<int> maxRankOf(const LayoutGraph& g, const std::optional<std::string>& v) {
    if (!v) {
        return std::nullopt;
    }
    const NodeLabel* node = g.findNode(*v);
    return node ? node->maxRank : std::nullopt;
}

std::optional<int> minRankOf(const LayoutGraph& g, const std::optional<std::string>& v) {
    if (!v) {
        return std::nullopt;
    }
    const NodeLabel* node = g.findNode(*v);
    return node ? node->minRank : std::nullopt;
}

}  // namespace

void ParentDummyChains::run(LayoutGraph& g) {
    PostorderMap nums = postorder(g);

    for (const auto& start : g.graph().dummyChains) {
        const NodeLabel* head = g.findNode(start);
        if (!head || !head->edgeObj) {
            continue;
        }
        EdgeKey edgeObj = *head->edgeObj;
        if (!nums.count(edgeObj.v) || !nums.count(edgeObj.w)) {
            LOG_WARN("Edge {} -> {} has an endpoint outside the hierarchy", edgeObj.v, edgeObj.w);
            continue;
        }

        PathData data = findPath(g, nums, edgeObj.v, edgeObj.w);
        const auto& path = data.path;
        size_t pathIdx = 0;
        std::optional<std::string> pathV = path.empty() ? std::nullopt : path[0];
        bool ascending = true;

        std::string v = start;
        while (v != edgeObj.w) {
            int rank = g.node(v).rank.value_or(0);

            if (ascending) {
                while (pathV != data.lca) {
                    std::optional<int> maxRank = maxRankOf(g, pathV);
                    if (!maxRank || *maxRank >= rank) {
                        break;
                    }
                    ++pathIdx;
                    pathV = pathIdx < path.size() ? path[pathIdx] : std::nullopt;
                }
                if (pathV == data.lca) {
                    ascending = false;
                }
            }

            if (!ascending) {
                while (pathIdx + 1 < path.size()) {
                    std::optional<int> minRank = minRankOf(g, path[pathIdx + 1]);
                    // As in dagre, where minRank <= rank is false for an undefined
                    // minRank: a node without one ends the descent
                    if (!minRank || *minRank > rank) {
                        break;
                    }
                    ++pathIdx;
                }
                pathV = path.empty() ? std::nullopt : path[pathIdx];
            }

            if (pathV) {
                g.setParent(v, *pathV);
            } else {
                g.clearParent(v);
            }

            std::vector<std::string> next = g.successors(v);
            if (next.empty()) {
                break;
            }
            v = next.front();
        }
    }
}

}  // namespace algorithms
}  // namespace strata
