#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace strata {

/// Identifies an edge: ordered endpoints plus an optional name for parallel edges.
struct EdgeKey {
    std::string v;
    std::string w;
    std::optional<std::string> name;

    EdgeKey() = default;
    EdgeKey(std::string v_, std::string w_, std::optional<std::string> n = std::nullopt)
        : v(std::move(v_)), w(std::move(w_)), name(std::move(n)) {}

    bool operator==(const EdgeKey& o) const = default;
};

struct EdgeKeyHash {
    size_t operator()(const EdgeKey& e) const noexcept {
        std::hash<std::string> h;
        size_t seed = h(e.v);
        seed ^= h(e.w) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        if (e.name) {
            seed ^= h(*e.name) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

struct GraphOptions {
    bool directed = true;
    bool multigraph = false;
    bool compound = false;
};

/**
 * @brief Labeled graph with string node ids, multi-edges and optional nesting
 *
 * Storage is an arena of slots indexed once by id. Slots are never reused, so
 * iterating live slots reproduces insertion order; a removed and re-added node
 * moves to the end. Every query that returns a list returns it in a
 * deterministic order (see each method).
 *
 * Structural misuse throws:
 * - setEdge() with an endpoint that is not a node: std::invalid_argument
 * - setParent() forming a cycle: std::invalid_argument
 * - node() / edge() on a missing key: std::out_of_range
 *
 * findNode() / findEdge() return nullptr instead, for callers that degrade
 * gracefully.
 */
template <typename N, typename E, typename G>
class BasicGraph {
public:
    using NodeLabelType = N;
    using EdgeLabelType = E;
    using GraphLabelType = G;

    explicit BasicGraph(GraphOptions options = {}) : options_(options) {}

    const GraphOptions& options() const { return options_; }
    bool isDirected() const { return options_.directed; }
    bool isMultigraph() const { return options_.multigraph; }
    bool isCompound() const { return options_.compound; }

    G& graph() { return graphLabel_; }
    const G& graph() const { return graphLabel_; }
    void setGraph(G label) { graphLabel_ = std::move(label); }

    // ===== Nodes =====

    /// Ensure the node exists; an existing label is kept.
    void setNode(const std::string& v);
    /// Create the node or replace its label.
    void setNode(const std::string& v, N label);

    bool hasNode(const std::string& v) const { return nodeIndex_.count(v) != 0; }

    N& node(const std::string& v);
    const N& node(const std::string& v) const;
    N* findNode(const std::string& v);
    const N* findNode(const std::string& v) const;

    void removeNode(const std::string& v);

    /// Live nodes in insertion order.
    std::vector<std::string> nodes() const;
    size_t nodeCount() const { return nodeCount_; }

    /// Nodes without in-edges, in node order.
    std::vector<std::string> sources() const;
    /// Nodes without out-edges, in node order.
    std::vector<std::string> sinks() const;

    // ===== Nesting =====

    void setParent(const std::string& v, const std::string& parent);
    /// Move v back to the top level.
    void clearParent(const std::string& v);
    std::optional<std::string> parent(const std::string& v) const;
    /// Children in the order they were attached.
    std::vector<std::string> children(const std::string& v) const;
    /// Top-level nodes. In a non-compound graph every node is top-level.
    std::vector<std::string> children() const;
    bool hasChildren(const std::string& v) const;

    // ===== Edges =====

    void setEdge(const std::string& v, const std::string& w, E label = E{},
                 std::optional<std::string> name = std::nullopt);
    void setEdge(const EdgeKey& e, E label) { setEdge(e.v, e.w, std::move(label), e.name); }

    bool hasEdge(const std::string& v, const std::string& w,
                 const std::optional<std::string>& name = std::nullopt) const;
    bool hasEdge(const EdgeKey& e) const { return hasEdge(e.v, e.w, e.name); }

    E& edge(const EdgeKey& e);
    const E& edge(const EdgeKey& e) const;
    E& edge(const std::string& v, const std::string& w,
            const std::optional<std::string>& name = std::nullopt) {
        return edge(EdgeKey{v, w, name});
    }
    const E& edge(const std::string& v, const std::string& w,
                  const std::optional<std::string>& name = std::nullopt) const {
        return edge(EdgeKey{v, w, name});
    }
    E* findEdge(const EdgeKey& e);
    const E* findEdge(const EdgeKey& e) const;
    E* findEdge(const std::string& v, const std::string& w,
                const std::optional<std::string>& name = std::nullopt) {
        return findEdge(EdgeKey{v, w, name});
    }
    const E* findEdge(const std::string& v, const std::string& w,
                      const std::optional<std::string>& name = std::nullopt) const {
        return findEdge(EdgeKey{v, w, name});
    }

    void removeEdge(const EdgeKey& e);
    void removeEdge(const std::string& v, const std::string& w,
                    const std::optional<std::string>& name = std::nullopt) {
        removeEdge(EdgeKey{v, w, name});
    }

    /// Live edges in insertion order.
    std::vector<EdgeKey> edges() const;
    size_t edgeCount() const { return edgeCount_; }

    /// Edges into v in insertion order, optionally only those from u.
    std::vector<EdgeKey> inEdges(const std::string& v,
                                 const std::optional<std::string>& u = std::nullopt) const;
    /// Edges out of v in insertion order, optionally only those to w.
    std::vector<EdgeKey> outEdges(const std::string& v,
                                  const std::optional<std::string>& w = std::nullopt) const;
    /// inEdges(v, w) followed by outEdges(v, w).
    std::vector<EdgeKey> nodeEdges(const std::string& v,
                                   const std::optional<std::string>& w = std::nullopt) const;

    /// Distinct neighbours, each listed at the position of its first live link.
    std::vector<std::string> predecessors(const std::string& v) const;
    std::vector<std::string> successors(const std::string& v) const;
    /// predecessors() then successors(), without repeats.
    std::vector<std::string> neighbors(const std::string& v) const;

    /// Pre-order DFS from each root over successors (directed) or neighbours.
    std::vector<std::string> preorder(const std::vector<std::string>& roots) const;
    /// Post-order DFS from each root over successors (directed) or neighbours.
    std::vector<std::string> postorder(const std::vector<std::string>& roots) const;

private:
    struct Link {
        size_t node;
        int count;
    };

    struct NodeSlot {
        std::string id;
        N label;
        bool alive = true;
        std::optional<size_t> parent;
        std::vector<size_t> children;
        std::vector<size_t> in;
        std::vector<size_t> out;
        std::vector<Link> preds;
        std::vector<Link> succs;
    };

    struct EdgeSlot {
        EdgeKey key;
        size_t v;
        size_t w;
        E label;
        bool alive = true;
    };

    GraphOptions options_;
    G graphLabel_{};
    std::vector<NodeSlot> nodes_;
    std::unordered_map<std::string, size_t> nodeIndex_;
    std::vector<EdgeSlot> edges_;
    std::unordered_map<EdgeKey, size_t, EdgeKeyHash> edgeIndex_;
    std::vector<size_t> rootChildren_;
    size_t nodeCount_ = 0;
    size_t edgeCount_ = 0;

    EdgeKey canonical(const std::string& v, const std::string& w,
                      const std::optional<std::string>& name) const;
    size_t slotOf(const std::string& v) const;
    void detachFromParent(size_t slot);
    static void addLink(std::vector<Link>& links, size_t node);
    static void dropLink(std::vector<Link>& links, size_t node);
    std::vector<std::string> linkIds(const std::vector<Link>& links) const;
    std::vector<std::string> navigate(const std::string& v) const;
};

// ===== Implementation =====

template <typename N, typename E, typename G>
void BasicGraph<N, E, G>::setNode(const std::string& v) {
    if (hasNode(v)) {
        return;
    }
    setNode(v, N{});
}

template <typename N, typename E, typename G>
void BasicGraph<N, E, G>::setNode(const std::string& v, N label) {
    auto it = nodeIndex_.find(v);
    if (it != nodeIndex_.end()) {
        nodes_[it->second].label = std::move(label);
        return;
    }
    size_t slot = nodes_.size();
    NodeSlot s;
    s.id = v;
    s.label = std::move(label);
    nodes_.push_back(std::move(s));
    nodeIndex_.emplace(v, slot);
    if (options_.compound) {
        rootChildren_.push_back(slot);
    }
    ++nodeCount_;
}

template <typename N, typename E, typename G>
size_t BasicGraph<N, E, G>::slotOf(const std::string& v) const {
    auto it = nodeIndex_.find(v);
    if (it == nodeIndex_.end()) {
        throw std::out_of_range("Unknown node: " + v);
    }
    return it->second;
}

template <typename N, typename E, typename G>
N& BasicGraph<N, E, G>::node(const std::string& v) {
    return nodes_[slotOf(v)].label;
}

template <typename N, typename E, typename G>
const N& BasicGraph<N, E, G>::node(const std::string& v) const {
    return nodes_[slotOf(v)].label;
}

template <typename N, typename E, typename G>
N* BasicGraph<N, E, G>::findNode(const std::string& v) {
    auto it = nodeIndex_.find(v);
    return it == nodeIndex_.end() ? nullptr : &nodes_[it->second].label;
}

template <typename N, typename E, typename G>
const N* BasicGraph<N, E, G>::findNode(const std::string& v) const {
    auto it = nodeIndex_.find(v);
    return it == nodeIndex_.end() ? nullptr : &nodes_[it->second].label;
}

template <typename N, typename E, typename G>
void BasicGraph<N, E, G>::removeNode(const std::string& v) {
    auto it = nodeIndex_.find(v);
    if (it == nodeIndex_.end()) {
        return;
    }
    size_t slot = it->second;

    if (options_.compound) {
        detachFromParent(slot);
        std::vector<size_t> kids = nodes_[slot].children;
        for (size_t child : kids) {
            clearParent(nodes_[child].id);
        }
        nodes_[slot].children.clear();
    }

    for (size_t e : std::vector<size_t>(nodes_[slot].in)) {
        removeEdge(edges_[e].key);
    }
    for (size_t e : std::vector<size_t>(nodes_[slot].out)) {
        removeEdge(edges_[e].key);
    }

    nodes_[slot].alive = false;
    nodeIndex_.erase(it);
    --nodeCount_;
}

template <typename N, typename E, typename G>
std::vector<std::string> BasicGraph<N, E, G>::nodes() const {
    std::vector<std::string> result;
    result.reserve(nodeCount_);
    for (const auto& s : nodes_) {
        if (s.alive) {
            result.push_back(s.id);
        }
    }
    return result;
}

template <typename N, typename E, typename G>
std::vector<std::string> BasicGraph<N, E, G>::sources() const {
    std::vector<std::string> result;
    for (const auto& s : nodes_) {
        if (s.alive && s.in.empty()) {
            result.push_back(s.id);
        }
    }
    return result;
}

template <typename N, typename E, typename G>
std::vector<std::string> BasicGraph<N, E, G>::sinks() const {
    std::vector<std::string> result;
    for (const auto& s : nodes_) {
        if (s.alive && s.out.empty()) {
            result.push_back(s.id);
        }
    }
    return result;
}

template <typename N, typename E, typename G>
void BasicGraph<N, E, G>::detachFromParent(size_t slot) {
    auto& list = nodes_[slot].parent ? nodes_[*nodes_[slot].parent].children : rootChildren_;
    list.erase(std::remove(list.begin(), list.end(), slot), list.end());
    nodes_[slot].parent.reset();
}

template <typename N, typename E, typename G>
void BasicGraph<N, E, G>::setParent(const std::string& v, const std::string& parent) {
    if (!options_.compound) {
        throw std::invalid_argument("Cannot set parent in a non-compound graph");
    }
    if (v == parent) {
        throw std::invalid_argument("Node cannot be its own parent: " + v);
    }
    setNode(v);
    setNode(parent);

    size_t child = slotOf(v);
    size_t target = slotOf(parent);
    for (std::optional<size_t> a = target; a; a = nodes_[*a].parent) {
        if (*a == child) {
            throw std::invalid_argument("Setting " + parent + " as parent of " + v +
                                        " would create a cycle");
        }
    }

    detachFromParent(child);
    nodes_[child].parent = target;
    nodes_[target].children.push_back(child);
}

template <typename N, typename E, typename G>
void BasicGraph<N, E, G>::clearParent(const std::string& v) {
    if (!options_.compound || !hasNode(v)) {
        return;
    }
    size_t slot = slotOf(v);
    detachFromParent(slot);
    rootChildren_.push_back(slot);
}

template <typename N, typename E, typename G>
std::optional<std::string> BasicGraph<N, E, G>::parent(const std::string& v) const {
    if (!options_.compound) {
        return std::nullopt;
    }
    auto it = nodeIndex_.find(v);
    if (it == nodeIndex_.end() || !nodes_[it->second].parent) {
        return std::nullopt;
    }
    return nodes_[*nodes_[it->second].parent].id;
}

template <typename N, typename E, typename G>
std::vector<std::string> BasicGraph<N, E, G>::children(const std::string& v) const {
    std::vector<std::string> result;
    if (!options_.compound) {
        return result;
    }
    auto it = nodeIndex_.find(v);
    if (it == nodeIndex_.end()) {
        return result;
    }
    for (size_t c : nodes_[it->second].children) {
        result.push_back(nodes_[c].id);
    }
    return result;
}

template <typename N, typename E, typename G>
std::vector<std::string> BasicGraph<N, E, G>::children() const {
    if (!options_.compound) {
        return nodes();
    }
    std::vector<std::string> result;
    result.reserve(rootChildren_.size());
    for (size_t c : rootChildren_) {
        result.push_back(nodes_[c].id);
    }
    return result;
}

template <typename N, typename E, typename G>
bool BasicGraph<N, E, G>::hasChildren(const std::string& v) const {
    if (!options_.compound) {
        return false;
    }
    auto it = nodeIndex_.find(v);
    return it != nodeIndex_.end() && !nodes_[it->second].children.empty();
}

template <typename N, typename E, typename G>
EdgeKey BasicGraph<N, E, G>::canonical(const std::string& v, const std::string& w,
                                       const std::optional<std::string>& name) const {
    std::optional<std::string> n = options_.multigraph ? name : std::nullopt;
    if (!options_.directed && w < v) {
        return EdgeKey{w, v, n};
    }
    return EdgeKey{v, w, n};
}

template <typename N, typename E, typename G>
void BasicGraph<N, E, G>::addLink(std::vector<Link>& links, size_t node) {
    for (auto& l : links) {
        if (l.node == node) {
            ++l.count;
            return;
        }
    }
    links.push_back({node, 1});
}

template <typename N, typename E, typename G>
void BasicGraph<N, E, G>::dropLink(std::vector<Link>& links, size_t node) {
    for (auto it = links.begin(); it != links.end(); ++it) {
        if (it->node == node) {
            if (--it->count == 0) {
                links.erase(it);
            }
            return;
        }
    }
}

template <typename N, typename E, typename G>
void BasicGraph<N, E, G>::setEdge(const std::string& v, const std::string& w, E label,
                                  std::optional<std::string> name) {
    EdgeKey key = canonical(v, w, name);
    auto it = edgeIndex_.find(key);
    if (it != edgeIndex_.end()) {
        edges_[it->second].label = std::move(label);
        return;
    }
    auto vi = nodeIndex_.find(key.v);
    auto wi = nodeIndex_.find(key.w);
    if (vi == nodeIndex_.end() || wi == nodeIndex_.end()) {
        throw std::invalid_argument("Edge " + v + " -> " + w + " references a missing node");
    }

    size_t slot = edges_.size();
    edges_.push_back(EdgeSlot{key, vi->second, wi->second, std::move(label), true});
    edgeIndex_.emplace(std::move(key), slot);

    NodeSlot& tail = nodes_[vi->second];
    NodeSlot& head = nodes_[wi->second];
    tail.out.push_back(slot);
    head.in.push_back(slot);
    addLink(tail.succs, wi->second);
    addLink(head.preds, vi->second);
    ++edgeCount_;
}

template <typename N, typename E, typename G>
bool BasicGraph<N, E, G>::hasEdge(const std::string& v, const std::string& w,
                                  const std::optional<std::string>& name) const {
    return edgeIndex_.count(canonical(v, w, name)) != 0;
}

template <typename N, typename E, typename G>
E& BasicGraph<N, E, G>::edge(const EdgeKey& e) {
    E* label = findEdge(e);
    if (!label) {
        throw std::out_of_range("Unknown edge: " + e.v + " -> " + e.w);
    }
    return *label;
}

template <typename N, typename E, typename G>
const E& BasicGraph<N, E, G>::edge(const EdgeKey& e) const {
    const E* label = findEdge(e);
    if (!label) {
        throw std::out_of_range("Unknown edge: " + e.v + " -> " + e.w);
    }
    return *label;
}

template <typename N, typename E, typename G>
E* BasicGraph<N, E, G>::findEdge(const EdgeKey& e) {
    auto it = edgeIndex_.find(canonical(e.v, e.w, e.name));
    return it == edgeIndex_.end() ? nullptr : &edges_[it->second].label;
}

template <typename N, typename E, typename G>
const E* BasicGraph<N, E, G>::findEdge(const EdgeKey& e) const {
    auto it = edgeIndex_.find(canonical(e.v, e.w, e.name));
    return it == edgeIndex_.end() ? nullptr : &edges_[it->second].label;
}

template <typename N, typename E, typename G>
void BasicGraph<N, E, G>::removeEdge(const EdgeKey& e) {
    auto it = edgeIndex_.find(canonical(e.v, e.w, e.name));
    if (it == edgeIndex_.end()) {
        return;
    }
    size_t slot = it->second;
    EdgeSlot& es = edges_[slot];
    NodeSlot& tail = nodes_[es.v];
    NodeSlot& head = nodes_[es.w];
    tail.out.erase(std::remove(tail.out.begin(), tail.out.end(), slot), tail.out.end());
    head.in.erase(std::remove(head.in.begin(), head.in.end(), slot), head.in.end());
    dropLink(tail.succs, es.w);
    dropLink(head.preds, es.v);
    es.alive = false;
    edgeIndex_.erase(it);
    --edgeCount_;
}

template <typename N, typename E, typename G>
std::vector<EdgeKey> BasicGraph<N, E, G>::edges() const {
    std::vector<EdgeKey> result;
    result.reserve(edgeCount_);
    for (const auto& e : edges_) {
        if (e.alive) {
            result.push_back(e.key);
        }
    }
    return result;
}

template <typename N, typename E, typename G>
std::vector<EdgeKey> BasicGraph<N, E, G>::inEdges(const std::string& v,
                                                  const std::optional<std::string>& u) const {
    std::vector<EdgeKey> result;
    auto it = nodeIndex_.find(v);
    if (it == nodeIndex_.end()) {
        return result;
    }
    for (size_t e : nodes_[it->second].in) {
        if (!u || edges_[e].key.v == *u) {
            result.push_back(edges_[e].key);
        }
    }
    return result;
}

template <typename N, typename E, typename G>
std::vector<EdgeKey> BasicGraph<N, E, G>::outEdges(const std::string& v,
                                                   const std::optional<std::string>& w) const {
    std::vector<EdgeKey> result;
    auto it = nodeIndex_.find(v);
    if (it == nodeIndex_.end()) {
        return result;
    }
    for (size_t e : nodes_[it->second].out) {
        if (!w || edges_[e].key.w == *w) {
            result.push_back(edges_[e].key);
        }
    }
    return result;
}

template <typename N, typename E, typename G>
std::vector<EdgeKey> BasicGraph<N, E, G>::nodeEdges(const std::string& v,
                                                    const std::optional<std::string>& w) const {
    std::vector<EdgeKey> result = inEdges(v, w);
    std::vector<EdgeKey> out = outEdges(v, w);
    result.insert(result.end(), out.begin(), out.end());
    return result;
}

template <typename N, typename E, typename G>
std::vector<std::string> BasicGraph<N, E, G>::linkIds(const std::vector<Link>& links) const {
    std::vector<std::string> result;
    result.reserve(links.size());
    for (const auto& l : links) {
        result.push_back(nodes_[l.node].id);
    }
    return result;
}

template <typename N, typename E, typename G>
std::vector<std::string> BasicGraph<N, E, G>::predecessors(const std::string& v) const {
    auto it = nodeIndex_.find(v);
    if (it == nodeIndex_.end()) {
        return {};
    }
    return linkIds(nodes_[it->second].preds);
}

template <typename N, typename E, typename G>
std::vector<std::string> BasicGraph<N, E, G>::successors(const std::string& v) const {
    auto it = nodeIndex_.find(v);
    if (it == nodeIndex_.end()) {
        return {};
    }
    return linkIds(nodes_[it->second].succs);
}

template <typename N, typename E, typename G>
std::vector<std::string> BasicGraph<N, E, G>::neighbors(const std::string& v) const {
    auto it = nodeIndex_.find(v);
    if (it == nodeIndex_.end()) {
        return {};
    }
    const NodeSlot& s = nodes_[it->second];
    std::vector<std::string> result;
    std::unordered_set<size_t> seen;
    for (const auto& l : s.preds) {
        if (seen.insert(l.node).second) {
            result.push_back(nodes_[l.node].id);
        }
    }
    for (const auto& l : s.succs) {
        if (seen.insert(l.node).second) {
            result.push_back(nodes_[l.node].id);
        }
    }
    return result;
}

template <typename N, typename E, typename G>
std::vector<std::string> BasicGraph<N, E, G>::navigate(const std::string& v) const {
    return options_.directed ? successors(v) : neighbors(v);
}

template <typename N, typename E, typename G>
std::vector<std::string> BasicGraph<N, E, G>::preorder(const std::vector<std::string>& roots) const {
    std::vector<std::string> acc;
    std::unordered_set<std::string> visited;
    for (const auto& root : roots) {
        if (!hasNode(root)) {
            throw std::invalid_argument("Graph does not have node: " + root);
        }
        std::vector<std::string> stack{root};
        while (!stack.empty()) {
            std::string curr = std::move(stack.back());
            stack.pop_back();
            if (!visited.insert(curr).second) {
                continue;
            }
            acc.push_back(curr);
            auto next = navigate(curr);
            for (auto it = next.rbegin(); it != next.rend(); ++it) {
                stack.push_back(*it);
            }
        }
    }
    return acc;
}

template <typename N, typename E, typename G>
std::vector<std::string> BasicGraph<N, E, G>::postorder(const std::vector<std::string>& roots) const {
    std::vector<std::string> acc;
    std::unordered_set<std::string> visited;
    for (const auto& root : roots) {
        if (!hasNode(root)) {
            throw std::invalid_argument("Graph does not have node: " + root);
        }
        std::vector<std::pair<std::string, bool>> stack{{root, false}};
        while (!stack.empty()) {
            auto [curr, done] = std::move(stack.back());
            stack.pop_back();
            if (done) {
                acc.push_back(curr);
                continue;
            }
            if (!visited.insert(curr).second) {
                continue;
            }
            stack.emplace_back(curr, true);
            auto next = navigate(curr);
            for (auto it = next.rbegin(); it != next.rend(); ++it) {
                stack.emplace_back(*it, false);
            }
        }
    }
    return acc;
}

}  // namespace strata
