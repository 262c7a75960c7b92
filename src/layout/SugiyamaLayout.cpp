#include "strata/layout/SugiyamaLayout.h"
#include "strata/layout/Layout.h"
#include "strata/layout/ICoordinateAssignment.h"
#include "strata/layout/ICrossingMinimization.h"
#include "strata/layout/ICycleRemoval.h"
#include "strata/layout/ILayerAssignment.h"
#include "strata/layout/util/LayoutUtils.h"
#include "strata/common/Logger.h"
#include "sugiyama/BorderSegments.h"
#include "sugiyama/ConservativeLayout.h"
#include "sugiyama/CoordinateAssignment.h"
#include "sugiyama/CoordinateSystem.h"
#include "sugiyama/CrossingMinimization.h"
#include "sugiyama/CycleRemoval.h"
#include "sugiyama/GreedyCycleRemoval.h"
#include "sugiyama/LayerAssignment.h"
#include "sugiyama/NestingGraph.h"
#include "sugiyama/Normalize.h"
#include "sugiyama/ParentDummyChains.h"
#include "sugiyama/SelfEdges.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace strata {

using namespace algorithms;

namespace {

std::unique_ptr<ICycleRemoval> makeCycleRemoval(CycleRemovalStrategy strategy) {
    if (strategy == CycleRemovalStrategy::Greedy) {
        return std::make_unique<GreedyCycleRemoval>();
    }
    return std::make_unique<CycleRemoval>();
}

void shift(std::optional<double>& value, double delta) {
    if (value) {
        *value += delta;
    }
}

}  // namespace

struct SugiyamaLayout::LayoutState {
    LayoutGraph graph{GraphOptions{true, true, false}};

    std::unique_ptr<ICycleRemoval> defaultCycleRemoval;
    std::unique_ptr<ILayerAssignment> defaultLayerAssignment;
};

SugiyamaLayout::SugiyamaLayout()
    : crossingMinimization_(std::make_shared<BarycenterCrossingMinimization>())
    , coordinateAssignment_(std::make_shared<BrandesKoepfCoordinateAssignment>())
    , state_(std::make_unique<LayoutState>()) {}

SugiyamaLayout::~SugiyamaLayout() = default;

SugiyamaLayout::SugiyamaLayout(SugiyamaLayout&&) noexcept = default;
SugiyamaLayout& SugiyamaLayout::operator=(SugiyamaLayout&&) noexcept = default;

void SugiyamaLayout::setCycleRemoval(std::shared_ptr<ICycleRemoval> impl) {
    cycleRemoval_ = std::move(impl);
}

void SugiyamaLayout::setLayerAssignment(std::shared_ptr<ILayerAssignment> impl) {
    layerAssignment_ = std::move(impl);
}

void SugiyamaLayout::setCrossingMinimization(std::shared_ptr<ICrossingMinimization> impl) {
    if (impl) crossingMinimization_ = std::move(impl);
}

void SugiyamaLayout::setCoordinateAssignment(std::shared_ptr<ICoordinateAssignment> impl) {
    if (impl) coordinateAssignment_ = std::move(impl);
}

// =============================================================================
// Working graph
// =============================================================================

void SugiyamaLayout::buildWorkingGraph(const LayoutGraph& input) {
    state_ = std::make_unique<LayoutState>();
    LayoutGraph& g = state_->graph;
    g = LayoutGraph(GraphOptions{true, true, input.isCompound()});

    GraphLabel label;
    static_cast<LayoutOptions&>(label) = static_cast<const LayoutOptions&>(input.graph());
    g.setGraph(std::move(label));

    state_->defaultCycleRemoval = makeCycleRemoval(g.graph().acyclicer);
    state_->defaultLayerAssignment = makeLayerAssignment(g.graph().ranker);

    for (const auto& v : input.nodes()) {
        const NodeLabel& node = input.node(v);
        NodeLabel copy(node.width, node.height);
        if (!input.hasChildren(v)) {
            copy.rank = node.rank;
        }
        g.setNode(v, std::move(copy));
    }
    if (input.isCompound()) {
        for (const auto& v : input.nodes()) {
            if (auto parent = input.parent(v)) {
                g.setParent(v, *parent);
            }
        }
    }
    for (const auto& e : input.edges()) {
        const EdgeLabel& edge = input.edge(e);
        EdgeLabel copy;
        copy.width = edge.width;
        copy.height = edge.height;
        copy.labelpos = edge.labelpos;
        copy.labeloffset = edge.labeloffset;
        copy.minlen = edge.minlen;
        copy.weight = edge.weight;
        g.setEdge(e, std::move(copy));
    }
}

void SugiyamaLayout::updateInputGraph(LayoutGraph& input) const {
    const LayoutGraph& g = state_->graph;

    for (const auto& v : input.nodes()) {
        const NodeLabel* layoutLabel = g.findNode(v);
        if (!layoutLabel) {
            LOG_WARN("Node {} missing from the layout graph", v);
            continue;
        }
        NodeLabel& inputLabel = input.node(v);
        inputLabel.x = layoutLabel->x;
        inputLabel.y = layoutLabel->y;
        inputLabel.rank = layoutLabel->rank;
        inputLabel.order = layoutLabel->order;
        if (g.hasChildren(v)) {
            inputLabel.width = layoutLabel->width;
            inputLabel.height = layoutLabel->height;
            inputLabel.minRank = layoutLabel->minRank;
            inputLabel.maxRank = layoutLabel->maxRank;
        }
    }

    for (const auto& e : input.edges()) {
        const EdgeLabel* layoutLabel = g.findEdge(e);
        if (!layoutLabel) {
            LOG_WARN("Edge {} -> {} missing from the layout graph", e.v, e.w);
            continue;
        }
        EdgeLabel& inputLabel = input.edge(e);
        inputLabel.points = layoutLabel->points;
        // Only edges with a label box get a label position
        if (inputLabel.width > 0.0 || inputLabel.height > 0.0) {
            inputLabel.x = layoutLabel->x;
            inputLabel.y = layoutLabel->y;
        }
    }
}

// =============================================================================
// Full pipeline
// =============================================================================

void SugiyamaLayout::layoutDagreish(LayoutGraph& graph) {
    stats_ = LayoutStats{};
    LOG_DEBUG("layoutDagreish: {} nodes, {} edges{}", graph.nodeCount(), graph.edgeCount(),
              graph.isCompound() ? ", compound" : "");

    buildWorkingGraph(graph);
    LayoutGraph& g = state_->graph;

    makeSpaceForEdgeLabels();
    removeCycles();
    rank();
    injectEdgeLabelProxies();
    LayoutUtils::removeEmptyRanks(g);
    if (g.isCompound()) {
        NestingGraph::cleanup(g);
    }
    LayoutUtils::normalizeRanks(g);
    removeEdgeLabelProxies();
    normalize();
    order();
    position();
    denormalize();
    translate();
    routeEdgeEnds();
    Acyclic::undo(g);

    updateInputGraph(graph);
}

void SugiyamaLayout::makeSpaceForEdgeLabels() {
    LayoutGraph& g = state_->graph;
    GraphLabel& graphLabel = g.graph();
    graphLabel.ranksep /= 2;
    bool horizontal = graphLabel.isHorizontal();

    for (const auto& e : g.edges()) {
        EdgeLabel& edge = g.edge(e);
        edge.minlen = std::max(edge.minlen, 1) * 2;
        if (edge.labelpos != LabelPos::C) {
            if (horizontal) {
                edge.height += edge.labeloffset;
            } else {
                edge.width += edge.labeloffset;
            }
        }
    }
}

void SugiyamaLayout::removeCycles() {
    LayoutGraph& g = state_->graph;
    SelfEdges::remove(g);
    const ICycleRemoval& strategy = cycleRemoval_ ? *cycleRemoval_ : *state_->defaultCycleRemoval;
    stats_.reversedEdges = Acyclic::run(g, strategy);
}

void SugiyamaLayout::rank() {
    LayoutGraph& g = state_->graph;
    if (g.isCompound()) {
        NestingGraph::run(g);
    }

    const ILayerAssignment& ranker =
        layerAssignment_ ? *layerAssignment_ : *state_->defaultLayerAssignment;
    LayoutGraph rankGraph = LayoutUtils::asNonCompoundGraph(g);
    LayerAssignmentResult ranks = ranker.assignLayers(rankGraph);
    LOG_DEBUG("{} ranked {} nodes over [{}, {}]", ranker.algorithmName(), ranks.rankedNodes,
              ranks.minRank, ranks.maxRank);

    for (const auto& v : g.nodes()) {
        if (g.hasChildren(v)) {
            continue;
        }
        const NodeLabel* ranked = rankGraph.findNode(v);
        if (ranked && ranked->rank) {
            g.node(v).rank = ranked->rank;
        }
    }
}

void SugiyamaLayout::injectEdgeLabelProxies() {
    LayoutGraph& g = state_->graph;
    for (const auto& e : g.edges()) {
        const EdgeLabel& edge = g.edge(e);
        if (edge.width <= 0.0 || edge.height <= 0.0) {
            continue;
        }
        std::optional<int> vRank = g.node(e.v).rank;
        std::optional<int> wRank = g.node(e.w).rank;
        if (!vRank || !wRank) {
            continue;
        }
        NodeLabel proxy;
        proxy.rank = (*wRank - *vRank) / 2 + *vRank;
        proxy.edgeObj = e;
        LayoutUtils::addDummyNode(g, DummyKind::EdgeProxy, std::move(proxy), "_ep");
    }
}

void SugiyamaLayout::removeEdgeLabelProxies() {
    LayoutGraph& g = state_->graph;
    for (const auto& v : g.nodes()) {
        const NodeLabel& node = g.node(v);
        if (node.dummy != DummyKind::EdgeProxy) {
            continue;
        }
        if (node.edgeObj) {
            if (EdgeLabel* edge = g.findEdge(*node.edgeObj)) {
                edge->labelRank = node.rank;
            }
        }
        g.removeNode(v);
    }
    std::optional<int> maxRank = LayoutUtils::maxRank(g);
    stats_.rankCount = maxRank ? *maxRank + 1 : 0;
}

void SugiyamaLayout::normalize() {
    LayoutGraph& g = state_->graph;
    if (g.isCompound()) {
        BorderSegments::assignRankMinMax(g);
    }
    Normalize::run(g);
    if (g.isCompound()) {
        ParentDummyChains::run(g);
        BorderSegments::add(g);
    }

    for (const auto& v : g.nodes()) {
        if (g.node(v).isDummy()) {
            ++stats_.dummyCount;
        }
    }
    LOG_DEBUG("{} ranks, {} dummy nodes", stats_.rankCount, stats_.dummyCount);
}

void SugiyamaLayout::order() {
    CrossingMinimizationResult result = crossingMinimization_->minimize(state_->graph);
    stats_.crossings = result.crossings;
    stats_.sweeps = result.sweeps;
}

void SugiyamaLayout::position() {
    LayoutGraph& g = state_->graph;
    CoordinateSystem::adjust(g);
    SelfEdges::insert(g);
    coordinateAssignment_->assign(g);
    SelfEdges::position(g);
    if (g.isCompound()) {
        BorderSegments::removeBorderNodes(g);
    }
}

void SugiyamaLayout::denormalize() {
    LayoutGraph& g = state_->graph;
    Normalize::undo(g);
    CoordinateSystem::undo(g);
}

void SugiyamaLayout::translate() {
    LayoutGraph& g = state_->graph;
    double minX = std::numeric_limits<double>::infinity();
    double minY = std::numeric_limits<double>::infinity();

    for (const auto& v : g.nodes()) {
        const NodeLabel& node = g.node(v);
        if (node.x && node.y) {
            minX = std::min(minX, *node.x - node.width / 2);
            minY = std::min(minY, *node.y - node.height / 2);
        }
    }
    // Edge label boxes count, intermediate points do not
    for (const auto& e : g.edges()) {
        const EdgeLabel& edge = g.edge(e);
        if (edge.x && edge.y) {
            minX = std::min(minX, *edge.x - edge.width / 2);
            minY = std::min(minY, *edge.y - edge.height / 2);
        }
    }
    if (!std::isfinite(minX) || !std::isfinite(minY)) {
        return;
    }

    double dx = -(minX - g.graph().marginx);
    double dy = -(minY - g.graph().marginy);
    for (const auto& v : g.nodes()) {
        NodeLabel& node = g.node(v);
        shift(node.x, dx);
        shift(node.y, dy);
    }
    for (const auto& e : g.edges()) {
        EdgeLabel& edge = g.edge(e);
        for (auto& p : edge.points) {
            p.x += dx;
            p.y += dy;
        }
        shift(edge.x, dx);
        shift(edge.y, dy);
    }
}

void SugiyamaLayout::routeEdgeEnds() {
    LayoutGraph& g = state_->graph;
    for (const auto& e : g.edges()) {
        const NodeLabel& source = g.node(e.v);
        const NodeLabel& target = g.node(e.w);
        EdgeLabel& edge = g.edge(e);

        std::vector<Point> internal = edge.points;
        if (internal.empty()) {
            internal.push_back({(source.x.value_or(0.0) + target.x.value_or(0.0)) / 2,
                                (source.y.value_or(0.0) + target.y.value_or(0.0)) / 2});
        }

        std::vector<Point> points;
        points.reserve(internal.size() + 2);
        points.push_back(LayoutUtils::intersectRect(LayoutUtils::nodeBox(source), internal.front()));
        points.insert(points.end(), internal.begin(), internal.end());
        points.push_back(LayoutUtils::intersectRect(LayoutUtils::nodeBox(target), internal.back()));
        edge.points = std::move(points);

        if ((edge.width > 0.0 || edge.height > 0.0) && !edge.x && !edge.y) {
            Point mid = edge.points[edge.points.size() / 2];
            if (edge.labelpos == LabelPos::L) {
                mid.x -= edge.labeloffset + edge.width / 2;
            } else if (edge.labelpos == LabelPos::R) {
                mid.x += edge.labeloffset + edge.width / 2;
            }
            edge.x = mid.x;
            edge.y = mid.y;
        }
    }
}

// =============================================================================
// Conservative pipeline
// =============================================================================

void SugiyamaLayout::layoutConservative(LayoutGraph& graph) {
    stats_ = LayoutStats{};
    LOG_DEBUG("layoutConservative: {} nodes, {} edges", graph.nodeCount(), graph.edgeCount());

    buildWorkingGraph(graph);
    LayoutGraph& g = state_->graph;

    const ICycleRemoval& strategy = cycleRemoval_ ? *cycleRemoval_ : *state_->defaultCycleRemoval;
    stats_.reversedEdges = Acyclic::run(g, strategy);

    ConservativeLayoutResult result = ConservativeLayout::run(g);
    stats_.rankCount = static_cast<int>(result.layering.size());
    stats_.crossings = crossingMinimization_->countCrossings(g, result.layering);

    Acyclic::undo(g);
    updateInputGraph(graph);
}

// =============================================================================
// Entry points
// =============================================================================

void layout(LayoutGraph& graph) {
    SugiyamaLayout engine;
    engine.layoutConservative(graph);
}

void layoutDagreish(LayoutGraph& graph) {
    SugiyamaLayout engine;
    engine.layoutDagreish(graph);
}

}  // namespace strata
