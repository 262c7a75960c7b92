#pragma once

#include "strata/core/LayoutGraph.h"
#include "strata/core/Types.h"

#include <optional>
#include <string>
#include <string_view>

namespace strata {

/// Helpers shared by the layout phases
class LayoutUtils {
public:
    /// Point where the segment from the box centre toward @p point leaves the box.
    /// A point at the centre yields the middle of the right side.
    /// @param box Node box, top-left based
    static Point intersectRect(const Rect& box, const Point& point);

    /// Box of a positioned node; unset coordinates count as 0
    static Rect nodeBox(const NodeLabel& node);

    /// Nodes grouped by rank and sorted by order. Nodes without a rank are skipped;
    /// ranks are shifted so the smallest one lands at index 0.
    static Layering buildLayerMatrix(const LayoutGraph& g);

    /// Shift ranks so the minimum is 0
    static void normalizeRanks(LayoutGraph& g);

    /// Close up ranks that hold no node, keeping every nodeRankFactor-th one
    /// (those carry compound borders). No-op without a nodeRankFactor.
    static void removeEmptyRanks(LayoutGraph& g);

    static std::optional<int> maxRank(const LayoutGraph& g);

    /// Add a synthetic node named after @p prefix
    /// @return The id actually used
    static std::string addDummyNode(LayoutGraph& g, DummyKind kind, NodeLabel label,
                                    std::string_view prefix);

    /// Leaves only, with the same edges and the same multigraph setting.
    /// Edges touching a compound node are dropped with a warning.
    static LayoutGraph asNonCompoundGraph(const LayoutGraph& g);

    /// Collapse parallel edges: weights add up and minlen is the maximum.
    /// Edges keep the order of their first occurrence.
    static LayoutGraph simplify(const LayoutGraph& g);

    /// Fresh id of the form prefix + N not yet used in @p g.
    /// Deterministic for a given graph state.
    template <typename Graph>
    static std::string uniqueId(const Graph& g, std::string_view prefix) {
        size_t n = g.nodeCount() + 1;
        std::string id;
        do {
            id = std::string(prefix) + std::to_string(n++);
        } while (g.hasNode(id));
        return id;
    }
};

}  // namespace strata
