#include "CoordinateAssignment.h"
#include "strata/common/Logger.h"
#include "strata/layout/util/LayoutUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace strata {
namespace algorithms {

namespace {

struct BlockNode {};
struct BlockEdge {
    double sep = 0.0;
};
struct BlockGraphLabel {};

using BlockGraph = BasicGraph<BlockNode, BlockEdge, BlockGraphLabel>;

std::optional<std::string> findOtherInnerSegmentNode(const LayoutGraph& g, const std::string& v) {
    if (!g.node(v).isDummy()) {
        return std::nullopt;
    }
    for (const auto& u : g.predecessors(v)) {
        if (g.node(u).isDummy()) {
            return u;
        }
    }
    return std::nullopt;
}

BlockGraph buildBlockGraph(const LayoutGraph& g, const Layering& layering,
                           const std::unordered_map<std::string, std::string>& root,
                           bool reverseSep) {
    BlockGraph blockGraph;
    for (const auto& layer : layering) {
        const std::string* u = nullptr;
        for (const auto& v : layer) {
            const std::string& vRoot = root.at(v);
            blockGraph.setNode(vRoot);
            if (u) {
                const std::string& uRoot = root.at(*u);
                double prevMax = 0.0;
                if (const BlockEdge* existing = blockGraph.findEdge(uRoot, vRoot)) {
                    prevMax = existing->sep;
                }
                double sep = BrandesKoepf::separation(g, v, *u, reverseSep);
                blockGraph.setEdge(uRoot, vRoot, BlockEdge{std::max(sep, prevMax)});
            }
            u = &v;
        }
    }
    return blockGraph;
}

/// Post-order walk of the block graph; a block is set once all blocks that
/// @p nextNodes yields for it are
template <typename SetXs, typename NextNodes>
void iterateBlocks(const BlockGraph& blockGraph, SetXs setXs, NextNodes nextNodes) {
    std::vector<std::string> stack = blockGraph.nodes();
    std::unordered_set<std::string> visited;
    while (!stack.empty()) {
        std::string elem = std::move(stack.back());
        stack.pop_back();
        if (visited.count(elem)) {
            setXs(elem);
        } else {
            visited.insert(elem);
            stack.push_back(elem);
            std::vector<std::string> next = nextNodes(elem);
            stack.insert(stack.end(), next.begin(), next.end());
        }
    }
}

// Shift of a labelled dummy's centre toward its label; the sign depends on
// which side of the neighbouring pair the dummy is on
double labelDelta(const NodeLabel& label, bool rightOfPair) {
    if (!label.labelpos) {
        return 0.0;
    }
    switch (*label.labelpos) {
        case LabelPos::L:
            return rightOfPair ? -label.width / 2 : label.width / 2;
        case LabelPos::R:
            return rightOfPair ? label.width / 2 : -label.width / 2;
        case LabelPos::C:
            break;
    }
    return 0.0;
}

const char* alignmentName(size_t index) {
    return toString(static_cast<Alignment>(index));
}

}  // namespace

void BrandesKoepf::addConflict(Conflicts& conflicts, const std::string& v, const std::string& w) {
    if (v > w) {
        conflicts[w].insert(v);
    } else {
        conflicts[v].insert(w);
    }
}

bool BrandesKoepf::hasConflict(const Conflicts& conflicts, const std::string& v,
                               const std::string& w) {
    const std::string& lo = v > w ? w : v;
    const std::string& hi = v > w ? v : w;
    auto it = conflicts.find(lo);
    return it != conflicts.end() && it->second.count(hi) != 0;
}

Conflicts BrandesKoepf::findType1Conflicts(const LayoutGraph& g, const Layering& layering) {
    Conflicts conflicts;
    for (size_t li = 1; li < layering.size(); ++li) {
        const auto& prevLayer = layering[li - 1];
        const auto& layer = layering[li];
        if (layer.empty()) {
            continue;
        }

        int k0 = 0;
        size_t scanPos = 0;
        const std::string& lastNode = layer.back();
        for (size_t i = 0; i < layer.size(); ++i) {
            const std::string& v = layer[i];
            std::optional<std::string> w = findOtherInnerSegmentNode(g, v);
            int k1 = w ? g.node(*w).order.value_or(0) : static_cast<int>(prevLayer.size());

            if (w || v == lastNode) {
                for (size_t s = scanPos; s <= i; ++s) {
                    const std::string& scanNode = layer[s];
                    bool scanDummy = g.node(scanNode).isDummy();
                    for (const auto& u : g.predecessors(scanNode)) {
                        const NodeLabel& uLabel = g.node(u);
                        int uPos = uLabel.order.value_or(0);
                        if ((uPos < k0 || k1 < uPos) && !(uLabel.isDummy() && scanDummy)) {
                            addConflict(conflicts, u, scanNode);
                        }
                    }
                }
                scanPos = i + 1;
                k0 = k1;
            }
        }
    }
    return conflicts;
}

Conflicts BrandesKoepf::findType2Conflicts(const LayoutGraph& g, const Layering& layering) {
    Conflicts conflicts;

    auto scan = [&](const std::vector<std::string>& south, size_t southPos, size_t southEnd,
                    std::optional<int> prevNorthBorder, std::optional<int> nextNorthBorder) {
        for (size_t i = southPos; i < southEnd; ++i) {
            const std::string& v = south[i];
            if (!g.node(v).isDummy()) {
                continue;
            }
            for (const auto& u : g.predecessors(v)) {
                const NodeLabel& uNode = g.node(u);
                if (!uNode.isDummy()) {
                    continue;
                }
                int order = uNode.order.value_or(0);
                bool before = prevNorthBorder && order < *prevNorthBorder;
                bool after = nextNorthBorder && order > *nextNorthBorder;
                if (before || after) {
                    addConflict(conflicts, u, v);
                }
            }
        }
    };

    for (size_t li = 1; li < layering.size(); ++li) {
        const auto& north = layering[li - 1];
        const auto& south = layering[li];

        std::optional<int> prevNorthPos = -1;
        std::optional<int> nextNorthPos;
        size_t southPos = 0;
        for (size_t southLookahead = 0; southLookahead < south.size(); ++southLookahead) {
            const std::string& v = south[southLookahead];
            if (g.node(v).dummy == DummyKind::Border) {
                std::vector<std::string> predecessors = g.predecessors(v);
                if (!predecessors.empty()) {
                    nextNorthPos = g.node(predecessors.front()).order.value_or(0);
                    scan(south, southPos, southLookahead, prevNorthPos, nextNorthPos);
                    southPos = southLookahead;
                    prevNorthPos = nextNorthPos;
                }
            }
            // Without a border seen yet nothing lies outside the north span
            if (nextNorthPos) {
                scan(south, southPos, south.size(), nextNorthPos, static_cast<int>(north.size()));
            }
        }
    }
    return conflicts;
}

BlockAlignment BrandesKoepf::verticalAlignment(
    [[maybe_unused]] const LayoutGraph& g, const Layering& layering, const Conflicts& conflicts,
    const std::function<std::vector<std::string>(const std::string&)>& neighborFn) {
    BlockAlignment result;
    std::unordered_map<std::string, int> pos;

    for (const auto& layer : layering) {
        for (size_t order = 0; order < layer.size(); ++order) {
            const std::string& v = layer[order];
            result.root[v] = v;
            result.align[v] = v;
            pos[v] = static_cast<int>(order);
        }
    }

    for (const auto& layer : layering) {
        int prevIdx = -1;
        for (const auto& v : layer) {
            std::vector<std::string> ws;
            for (auto& w : neighborFn(v)) {
                if (pos.count(w)) {
                    ws.push_back(std::move(w));
                }
            }
            if (ws.empty()) {
                continue;
            }
            std::stable_sort(ws.begin(), ws.end(), [&pos](const std::string& a, const std::string& b) {
                return pos.at(a) < pos.at(b);
            });

            double mp = (static_cast<double>(ws.size()) - 1) / 2;
            auto last = static_cast<size_t>(std::ceil(mp));
            for (auto i = static_cast<size_t>(std::floor(mp)); i <= last; ++i) {
                const std::string& w = ws[i];
                if (result.align[v] == v && prevIdx < pos.at(w) && !hasConflict(conflicts, v, w)) {
                    result.align[w] = v;
                    result.align[v] = result.root[v] = result.root[w];
                    prevIdx = pos.at(w);
                }
            }
        }
    }
    return result;
}

double BrandesKoepf::separation(const LayoutGraph& g, const std::string& v, const std::string& w,
                                bool reverseSep) {
    const GraphLabel& graphLabel = g.graph();
    const NodeLabel& vLabel = g.node(v);
    const NodeLabel& wLabel = g.node(w);

    double sum = vLabel.width / 2;
    double delta = labelDelta(vLabel, true);
    sum += reverseSep ? delta : -delta;

    sum += (vLabel.isDummy() ? graphLabel.edgesep : graphLabel.nodesep) / 2;
    sum += (wLabel.isDummy() ? graphLabel.edgesep : graphLabel.nodesep) / 2;

    sum += wLabel.width / 2;
    delta = labelDelta(wLabel, false);
    sum += reverseSep ? delta : -delta;
    return sum;
}

NodeXs BrandesKoepf::horizontalCompaction(const LayoutGraph& g, const Layering& layering,
                                          const std::unordered_map<std::string, std::string>& root,
                                          const std::unordered_map<std::string, std::string>& align,
                                          bool reverseSep) {
    NodeXs xs;
    BlockGraph blockG = buildBlockGraph(g, layering, root, reverseSep);
    BorderSide borderType = reverseSep ? BorderSide::Left : BorderSide::Right;

    iterateBlocks(
        blockG,
        [&](const std::string& elem) {
            double x = 0.0;
            for (const auto& e : blockG.inEdges(elem)) {
                x = std::max(x, xs[e.v] + blockG.edge(e).sep);
            }
            xs[elem] = x;
        },
        [&](const std::string& elem) { return blockG.predecessors(elem); });

    iterateBlocks(
        blockG,
        [&](const std::string& elem) {
            double min = std::numeric_limits<double>::infinity();
            for (const auto& e : blockG.outEdges(elem)) {
                min = std::min(min, xs[e.w] - blockG.edge(e).sep);
            }
            const NodeLabel& node = g.node(elem);
            if (min != std::numeric_limits<double>::infinity() && node.borderType != borderType) {
                xs[elem] = std::max(xs[elem], min);
            }
        },
        [&](const std::string& elem) { return blockG.successors(elem); });

    for (const auto& entry : align) {
        xs[entry.first] = xs[root.at(entry.first)];
    }
    return xs;
}

size_t BrandesKoepf::findSmallestWidthAlignment(const LayoutGraph& g,
                                                const std::array<NodeXs, 4>& xss) {
    size_t best = 0;
    double bestWidth = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < xss.size(); ++i) {
        double max = -std::numeric_limits<double>::infinity();
        double min = std::numeric_limits<double>::infinity();
        for (const auto& [v, x] : xss[i]) {
            double halfWidth = g.node(v).width / 2;
            max = std::max(x + halfWidth, max);
            min = std::min(x - halfWidth, min);
        }
        double width = max - min;
        if (width < bestWidth) {
            bestWidth = width;
            best = i;
        }
    }
    return best;
}

void BrandesKoepf::alignCoordinates(std::array<NodeXs, 4>& xss, size_t alignTo) {
    if (xss[alignTo].empty()) {
        return;
    }
    auto bounds = [](const NodeXs& xs) {
        double min = std::numeric_limits<double>::infinity();
        double max = -std::numeric_limits<double>::infinity();
        for (const auto& entry : xs) {
            min = std::min(min, entry.second);
            max = std::max(max, entry.second);
        }
        return std::make_pair(min, max);
    };

    auto [alignToMin, alignToMax] = bounds(xss[alignTo]);
    for (size_t i = 0; i < xss.size(); ++i) {
        if (i == alignTo || xss[i].empty()) {
            continue;
        }
        bool leftAligned = i == static_cast<size_t>(Alignment::UL) ||
                           i == static_cast<size_t>(Alignment::DL);
        auto [min, max] = bounds(xss[i]);
        double delta = leftAligned ? alignToMin - min : alignToMax - max;
        if (delta != 0.0) {
            for (auto& entry : xss[i]) {
                entry.second += delta;
            }
        }
    }
}

NodeXs BrandesKoepf::balance(const std::array<NodeXs, 4>& xss, std::optional<Alignment> align) {
    NodeXs result;
    for (const auto& [v, ul] : xss[0]) {
        if (align) {
            auto it = xss[static_cast<size_t>(*align)].find(v);
            result[v] = it != xss[static_cast<size_t>(*align)].end() ? it->second : ul;
            continue;
        }
        std::array<double, 4> values{};
        for (size_t i = 0; i < xss.size(); ++i) {
            auto it = xss[i].find(v);
            values[i] = it != xss[i].end() ? it->second : ul;
        }
        std::sort(values.begin(), values.end());
        result[v] = (values[1] + values[2]) / 2;
    }
    return result;
}

NodeXs BrandesKoepf::positionX(const LayoutGraph& g) {
    Layering layering = LayoutUtils::buildLayerMatrix(g);

    Conflicts conflicts = findType1Conflicts(g, layering);
    // Type 2 entries replace type 1 entries recorded under the same node
    for (auto& [v, ws] : findType2Conflicts(g, layering)) {
        conflicts[v] = std::move(ws);
    }

    std::array<NodeXs, 4> xss;
    for (int vert = 0; vert < 2; ++vert) {
        bool up = vert == 0;
        Layering adjustedLayering = layering;
        if (!up) {
            std::reverse(adjustedLayering.begin(), adjustedLayering.end());
        }
        for (int horiz = 0; horiz < 2; ++horiz) {
            bool right = horiz == 1;
            if (right) {
                for (auto& layer : adjustedLayering) {
                    std::reverse(layer.begin(), layer.end());
                }
            }

            auto neighborFn = [&g, up](const std::string& v) {
                return up ? g.predecessors(v) : g.successors(v);
            };
            BlockAlignment alignment = verticalAlignment(g, adjustedLayering, conflicts, neighborFn);
            NodeXs xs = horizontalCompaction(g, adjustedLayering, alignment.root, alignment.align, right);
            if (right) {
                for (auto& entry : xs) {
                    entry.second = -entry.second;
                }
            }
            xss[static_cast<size_t>(vert * 2 + horiz)] = std::move(xs);
        }
    }

    size_t smallest = findSmallestWidthAlignment(g, xss);
    LOG_DEBUG("Narrowest alignment: {}", alignmentName(smallest));
    alignCoordinates(xss, smallest);
    return balance(xss, g.graph().align);
}

void BrandesKoepf::positionY(LayoutGraph& g) {
    Layering layering = LayoutUtils::buildLayerMatrix(g);
    double rankSep = g.graph().ranksep;
    double prevY = 0.0;

    for (size_t i = 0; i < layering.size(); ++i) {
        double maxHeight = 0.0;
        for (const auto& v : layering[i]) {
            maxHeight = std::max(maxHeight, g.node(v).height);
        }
        for (const auto& v : layering[i]) {
            g.node(v).y = prevY + maxHeight / 2;
        }
        prevY += maxHeight;
        if (i + 1 < layering.size()) {
            prevY += rankSep;
        }
    }
}

CoordinateAssignmentResult BrandesKoepfCoordinateAssignment::assign(LayoutGraph& graph) const {
    CoordinateAssignmentResult result;
    BrandesKoepf::positionY(graph);

    LayoutGraph leaves = LayoutUtils::asNonCompoundGraph(graph);
    result.xs = BrandesKoepf::positionX(leaves);
    result.alignment = graph.graph().align;

    for (const auto& v : leaves.nodes()) {
        auto it = result.xs.find(v);
        graph.node(v).x = it != result.xs.end() ? it->second : 0.0;
    }
    return result;
}

}  // namespace algorithms
}  // namespace strata
