#pragma once

#include "strata/layout/ICoordinateAssignment.h"

#include <array>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata {
namespace algorithms {

/// Pairs of nodes whose segments must not be aligned, keyed by the smaller id
using Conflicts = std::map<std::string, std::set<std::string>>;

using NodeXs = std::unordered_map<std::string, double>;

/// Vertical alignment: blocks of nodes that share one x
struct BlockAlignment {
    std::unordered_map<std::string, std::string> root;   ///< Top node of v's block
    std::unordered_map<std::string, std::string> align;  ///< Next node down v's block, cyclic
};

/**
 * @brief Horizontal coordinates after Brandes and Koepf, "Fast and Simple
 * Horizontal Coordinate Assignment"
 *
 * Four alignments (up/down crossed with left/right) are compacted separately,
 * shifted onto the narrowest one and balanced by taking the average median of
 * the four candidate coordinates. Graph options supply nodesep, edgesep and an
 * optional single alignment.
 */
class BrandesKoepf {
public:
    /// Inner segments (dummy to dummy) win: a non-inner segment crossing one is marked
    static Conflicts findType1Conflicts(const LayoutGraph& g, const Layering& layering);

    /// Inner segments crossing a subgraph border segment
    static Conflicts findType2Conflicts(const LayoutGraph& g, const Layering& layering);

    static void addConflict(Conflicts& conflicts, const std::string& v, const std::string& w);
    static bool hasConflict(const Conflicts& conflicts, const std::string& v, const std::string& w);

    /// Align each node with the median of its neighbours on the previous layer
    /// of @p layering, unless that crosses an earlier alignment or a conflict
    static BlockAlignment verticalAlignment(
        const LayoutGraph& g, const Layering& layering, const Conflicts& conflicts,
        const std::function<std::vector<std::string>(const std::string&)>& neighborFn);

    /// Place blocks as far left as separation allows, then pull them right
    /// toward their successors. @p reverseSep mirrors the separation of
    /// labelled dummies for right-to-left passes.
    static NodeXs horizontalCompaction(const LayoutGraph& g, const Layering& layering,
                                       const std::unordered_map<std::string, std::string>& root,
                                       const std::unordered_map<std::string, std::string>& align,
                                       bool reverseSep);

    /// Index (UL, UR, DL, DR) of the alignment with the smallest total width.
    /// Ties keep the earlier alignment.
    static size_t findSmallestWidthAlignment(const LayoutGraph& g, const std::array<NodeXs, 4>& xss);

    /// Shift the left alignments onto the minimum of @p alignTo and the right
    /// ones onto its maximum
    static void alignCoordinates(std::array<NodeXs, 4>& xss, size_t alignTo);

    /// One alignment if @p align is set, else the mean of the two median candidates
    static NodeXs balance(const std::array<NodeXs, 4>& xss, std::optional<Alignment> align);

    static NodeXs positionX(const LayoutGraph& g);

    /// Stack the ranks top to bottom, ranksep apart, centring each node on
    /// its rank's tallest node
    static void positionY(LayoutGraph& g);

    /// Minimum distance between the centres of neighbours @p v and @p w
    static double separation(const LayoutGraph& g, const std::string& v, const std::string& w,
                             bool reverseSep);
};

class BrandesKoepfCoordinateAssignment : public ICoordinateAssignment {
public:
    using Result = CoordinateAssignmentResult;

    BrandesKoepfCoordinateAssignment() = default;

    const char* algorithmName() const override { return "Brandes-Koepf"; }

    /// positionY on the graph, positionX on its leaves. Leaves missing from the
    /// result are placed at x = 0.
    CoordinateAssignmentResult assign(LayoutGraph& graph) const override;
};

}  // namespace algorithms
}  // namespace strata
