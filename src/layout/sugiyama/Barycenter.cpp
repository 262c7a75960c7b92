#include "Barycenter.h"

#include <algorithm>
#include <unordered_map>

namespace strata {
namespace algorithms {

namespace {

struct ConflictEntry {
    size_t indegree = 0;
    std::vector<size_t> in;
    std::vector<size_t> out;
    std::vector<size_t> vs;
    size_t i = 0;
    std::optional<double> barycenter;
    std::optional<double> weight;
    bool merged = false;
};

void mergeEntries(std::vector<ConflictEntry>& entries, size_t target, size_t source) {
    ConflictEntry& t = entries[target];
    ConflictEntry& s = entries[source];

    double sum = 0.0;
    double weight = 0.0;
    if (t.barycenter && t.weight && *t.weight != 0.0) {
        sum += *t.barycenter * *t.weight;
        weight += *t.weight;
    }
    if (s.barycenter && s.weight && *s.weight != 0.0) {
        sum += *s.barycenter * *s.weight;
        weight += *s.weight;
    }

    std::vector<size_t> vs = std::move(s.vs);
    vs.insert(vs.end(), t.vs.begin(), t.vs.end());
    t.vs = std::move(vs);
    if (weight != 0.0) {
        t.barycenter = sum / weight;
        t.weight = weight;
    }
    t.i = std::min(t.i, s.i);
    s.merged = true;
}

void mergeBarycenters(BarycenterEntry& target, const SortResult& other) {
    if (!other.barycenter) {
        return;
    }
    double otherWeight = other.weight.value_or(0.0);
    if (target.barycenter && target.weight) {
        double denom = *target.weight + otherWeight;
        target.barycenter = (*target.barycenter * *target.weight + *other.barycenter * otherWeight) / denom;
        target.weight = denom;
    } else {
        target.barycenter = other.barycenter;
        target.weight = otherWeight;
    }
}

void expandSubgraphs(std::vector<SortEntry>& entries,
                     const std::unordered_map<std::string, SortResult>& subgraphs) {
    for (auto& entry : entries) {
        std::vector<std::string> vs;
        for (const auto& v : entry.vs) {
            auto it = subgraphs.find(v);
            if (it != subgraphs.end()) {
                vs.insert(vs.end(), it->second.vs.begin(), it->second.vs.end());
            } else {
                vs.push_back(v);
            }
        }
        entry.vs = std::move(vs);
    }
}

}  // namespace

std::vector<BarycenterEntry> Barycenter::compute(const LayerGraph& lg,
                                                 const std::vector<std::string>& movable) {
    std::vector<BarycenterEntry> result;
    result.reserve(movable.size());
    for (const auto& v : movable) {
        std::vector<EdgeKey> inV = lg.inEdges(v);
        if (inV.empty()) {
            result.push_back({v, std::nullopt, std::nullopt});
            continue;
        }
        double sum = 0.0;
        double weight = 0.0;
        for (const auto& e : inV) {
            double edgeWeight = lg.edge(e).weight;
            sum += edgeWeight * lg.node(e.v).order.value_or(0);
            weight += edgeWeight;
        }
        result.push_back({v, sum / weight, weight});
    }
    return result;
}

std::vector<SortEntry> Barycenter::resolveConflicts(const std::vector<BarycenterEntry>& entries,
                                                    const ConstraintGraph& cg) {
    std::unordered_map<std::string, size_t> index;
    std::vector<ConflictEntry> mapped(entries.size());
    for (size_t ix = 0; ix < entries.size(); ++ix) {
        index[entries[ix].v] = ix;
        mapped[ix].vs = {ix};
        mapped[ix].i = ix;
        mapped[ix].barycenter = entries[ix].barycenter;
        mapped[ix].weight = entries[ix].weight;
    }

    for (const auto& e : cg.edges()) {
        auto v = index.find(e.v);
        auto w = index.find(e.w);
        if (v == index.end() || w == index.end()) {
            continue;
        }
        ++mapped[w->second].indegree;
        mapped[v->second].out.push_back(w->second);
    }

    std::vector<size_t> sourceSet;
    for (size_t ix = 0; ix < mapped.size(); ++ix) {
        if (mapped[ix].indegree == 0) {
            sourceSet.push_back(ix);
        }
    }

    std::vector<size_t> processed;
    while (!sourceSet.empty()) {
        size_t v = sourceSet.back();
        sourceSet.pop_back();
        processed.push_back(v);

        std::vector<size_t> in = std::move(mapped[v].in);
        mapped[v].in.clear();
        for (auto it = in.rbegin(); it != in.rend(); ++it) {
            size_t u = *it;
            if (mapped[u].merged) {
                continue;
            }
            const auto& ub = mapped[u].barycenter;
            const auto& vb = mapped[v].barycenter;
            if (!ub || !vb || *ub >= *vb) {
                mergeEntries(mapped, v, u);
            }
        }

        for (size_t w : mapped[v].out) {
            mapped[w].in.push_back(v);
            if (--mapped[w].indegree == 0) {
                sourceSet.push_back(w);
            }
        }
    }

    std::vector<SortEntry> result;
    for (size_t ix : processed) {
        const ConflictEntry& entry = mapped[ix];
        if (entry.merged) {
            continue;
        }
        SortEntry out;
        for (size_t member : entry.vs) {
            out.vs.push_back(entries[member].v);
        }
        out.i = entry.i;
        out.barycenter = entry.barycenter;
        out.weight = entry.weight;
        result.push_back(std::move(out));
    }
    return result;
}

SortResult Barycenter::sort(const std::vector<SortEntry>& entries, bool biasRight) {
    std::vector<const SortEntry*> sortable;
    std::vector<const SortEntry*> unsortable;
    for (const auto& entry : entries) {
        (entry.barycenter ? sortable : unsortable).push_back(&entry);
    }

    std::sort(unsortable.begin(), unsortable.end(),
              [](const SortEntry* a, const SortEntry* b) { return a->i > b->i; });
    std::stable_sort(sortable.begin(), sortable.end(),
                     [biasRight](const SortEntry* a, const SortEntry* b) {
                         if (*a->barycenter < *b->barycenter) {
                             return true;
                         }
                         if (*a->barycenter > *b->barycenter) {
                             return false;
                         }
                         return biasRight ? a->i > b->i : a->i < b->i;
                     });

    SortResult result;
    double sum = 0.0;
    double weight = 0.0;
    size_t vsIndex = 0;

    auto consumeUnsortable = [&]() {
        while (!unsortable.empty() && unsortable.back()->i <= vsIndex) {
            const SortEntry* last = unsortable.back();
            unsortable.pop_back();
            result.vs.insert(result.vs.end(), last->vs.begin(), last->vs.end());
            ++vsIndex;
        }
    };

    consumeUnsortable();
    for (const SortEntry* entry : sortable) {
        vsIndex += entry->vs.size();
        result.vs.insert(result.vs.end(), entry->vs.begin(), entry->vs.end());
        if (entry->weight) {
            sum += *entry->barycenter * *entry->weight;
            weight += *entry->weight;
        }
        consumeUnsortable();
    }

    if (weight != 0.0) {
        result.barycenter = sum / weight;
        result.weight = weight;
    }
    return result;
}

SortResult Barycenter::sortSubgraph(const LayerGraph& lg, const std::string& v,
                                    const ConstraintGraph& cg, bool biasRight) {
    std::vector<std::string> movable = lg.children(v);
    const LayerNode* node = lg.findNode(v);
    std::optional<std::string> bl = node ? node->borderLeft : std::nullopt;
    std::optional<std::string> br = node ? node->borderRight : std::nullopt;

    if (bl) {
        movable.erase(std::remove_if(movable.begin(), movable.end(),
                                     [&](const std::string& w) { return w == *bl || (br && w == *br); }),
                      movable.end());
    }

    std::unordered_map<std::string, SortResult> subgraphs;
    std::vector<BarycenterEntry> barycenters = compute(lg, movable);
    for (auto& entry : barycenters) {
        if (lg.hasChildren(entry.v)) {
            SortResult subgraphResult = sortSubgraph(lg, entry.v, cg, biasRight);
            if (subgraphResult.barycenter) {
                mergeBarycenters(entry, subgraphResult);
            }
            subgraphs.emplace(entry.v, std::move(subgraphResult));
        }
    }

    std::vector<SortEntry> entries = resolveConflicts(barycenters, cg);
    expandSubgraphs(entries, subgraphs);
    SortResult result = sort(entries, biasRight);

    if (bl && br) {
        std::vector<std::string> vs;
        vs.reserve(result.vs.size() + 2);
        vs.push_back(*bl);
        vs.insert(vs.end(), result.vs.begin(), result.vs.end());
        vs.push_back(*br);
        result.vs = std::move(vs);

        std::vector<std::string> blPreds = lg.predecessors(*bl);
        std::vector<std::string> brPreds = lg.predecessors(*br);
        if (!blPreds.empty() && !brPreds.empty()) {
            double blOrder = lg.node(blPreds.front()).order.value_or(0);
            double brOrder = lg.node(brPreds.front()).order.value_or(0);
            double bc = result.barycenter.value_or(0.0);
            double w = result.weight.value_or(0.0);
            result.barycenter = (bc * w + blOrder + brOrder) / (w + 2);
            result.weight = w + 2;
        }
    }
    return result;
}

}  // namespace algorithms
}  // namespace strata
