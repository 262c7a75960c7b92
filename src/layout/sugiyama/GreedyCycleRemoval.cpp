#include "GreedyCycleRemoval.h"

#include <algorithm>
#include <cmath>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace strata {
namespace algorithms {

namespace {

struct Arc {
    size_t node;
    long long weight;
};

struct Entry {
    long long in = 0;
    long long out = 0;
    bool alive = true;
    std::optional<size_t> bucket;
    std::list<size_t>::iterator pos;
    std::vector<Arc> ins;   // Aggregated, in first-occurrence order
    std::vector<Arc> outs;
};

/// Bucketed work state. Each bucket is a FIFO: enqueue at the front, dequeue from the back.
class FasState {
public:
    FasState(std::vector<Entry> entries, size_t bucketCount, long long zeroIdx)
        : entries_(std::move(entries)), buckets_(bucketCount), zeroIdx_(zeroIdx) {
        for (size_t i = 0; i < entries_.size(); ++i) {
            assignBucket(i);
        }
        alive_ = entries_.size();
    }

    std::vector<std::pair<size_t, size_t>> run() {
        std::vector<std::pair<size_t, size_t>> results;
        const size_t last = buckets_.size() - 1;

        while (alive_ > 0) {
            while (auto v = dequeue(0)) {
                removeNode(*v, nullptr);
            }
            while (auto v = dequeue(last)) {
                removeNode(*v, nullptr);
            }
            if (alive_ == 0) {
                break;
            }
            bool removed = false;
            for (size_t i = last - 1; i > 0; --i) {
                if (auto v = dequeue(i)) {
                    removeNode(*v, &results);
                    removed = true;
                    break;
                }
            }
            if (!removed) {
                break;
            }
        }
        return results;
    }

private:
    std::vector<Entry> entries_;
    std::vector<std::list<size_t>> buckets_;
    long long zeroIdx_;
    size_t alive_ = 0;

    std::optional<size_t> dequeue(size_t bucket) {
        auto& list = buckets_[bucket];
        if (list.empty()) {
            return std::nullopt;
        }
        size_t v = list.back();
        list.pop_back();
        entries_[v].bucket.reset();
        return v;
    }

    void assignBucket(size_t v) {
        Entry& entry = entries_[v];
        if (entry.bucket) {
            buckets_[*entry.bucket].erase(entry.pos);
        }
        size_t idx;
        if (entry.out == 0) {
            idx = 0;
        } else if (entry.in == 0) {
            idx = buckets_.size() - 1;
        } else {
            long long raw = entry.out - entry.in + zeroIdx_;
            idx = static_cast<size_t>(
                std::clamp<long long>(raw, 0, static_cast<long long>(buckets_.size()) - 1));
        }
        buckets_[idx].push_front(v);
        entry.bucket = idx;
        entry.pos = buckets_[idx].begin();
    }

    void removeNode(size_t v, std::vector<std::pair<size_t, size_t>>* predecessors) {
        Entry& entry = entries_[v];
        for (const auto& arc : entry.ins) {
            Entry& u = entries_[arc.node];
            if (!u.alive || arc.node == v) {
                continue;
            }
            if (predecessors) {
                predecessors->emplace_back(arc.node, v);
            }
            u.out -= arc.weight;
            assignBucket(arc.node);
        }
        for (const auto& arc : entry.outs) {
            Entry& w = entries_[arc.node];
            if (!w.alive || arc.node == v) {
                continue;
            }
            w.in -= arc.weight;
            assignBucket(arc.node);
        }
        if (entry.bucket) {
            buckets_[*entry.bucket].erase(entry.pos);
            entry.bucket.reset();
        }
        entry.alive = false;
        --alive_;
    }
};

}  // namespace

CycleRemovalResult GreedyCycleRemoval::findEdgesToReverse(const LayoutGraph& graph) const {
    CycleRemovalResult result;
    result.isAcyclic = true;
    if (graph.nodeCount() <= 1) {
        return result;
    }

    std::vector<std::string> ids = graph.nodes();
    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < ids.size(); ++i) {
        index.emplace(ids[i], i);
    }

    std::vector<Entry> entries(ids.size());
    std::unordered_map<EdgeKey, size_t, EdgeKeyHash> pairIndex;
    std::vector<std::pair<size_t, size_t>> pairs;
    std::vector<long long> pairWeight;
    long long maxIn = 0;
    long long maxOut = 0;

    for (const auto& e : graph.edges()) {
        double raw = graph.edge(e).weight;
        long long weight = std::isfinite(raw) ? std::llround(raw) : 0;
        size_t v = index.at(e.v);
        size_t w = index.at(e.w);

        auto [it, inserted] = pairIndex.emplace(EdgeKey{e.v, e.w}, pairs.size());
        if (inserted) {
            pairs.emplace_back(v, w);
            pairWeight.push_back(weight);
        } else {
            pairWeight[it->second] += weight;
        }
        maxOut = std::max(maxOut, entries[v].out += weight);
        maxIn = std::max(maxIn, entries[w].in += weight);
    }

    for (size_t i = 0; i < pairs.size(); ++i) {
        auto [v, w] = pairs[i];
        entries[v].outs.push_back({w, pairWeight[i]});
        entries[w].ins.push_back({v, pairWeight[i]});
    }

    size_t bucketCount = static_cast<size_t>(std::max<long long>(maxOut + maxIn + 3, 3));
    FasState state(std::move(entries), bucketCount, maxIn + 1);

    for (const auto& [v, w] : state.run()) {
        for (auto& e : graph.outEdges(ids[v], ids[w])) {
            result.reversedEdges.push_back(std::move(e));
        }
    }
    result.isAcyclic = result.reversedEdges.empty();
    return result;
}

bool GreedyCycleRemoval::hasCycles(const LayoutGraph& graph) const {
    return !findEdgesToReverse(graph).isAcyclic;
}

}  // namespace algorithms
}  // namespace strata
