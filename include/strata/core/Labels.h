#pragma once

#include "strata/core/Graph.h"
#include "strata/core/Types.h"
#include "strata/layout/config/LayoutOptions.h"

#include <optional>
#include <string>
#include <vector>

namespace strata {

/// Side of the edge an edge label is drawn on
enum class LabelPos {
    L,
    C,
    R
};

/// Kind of synthetic node the pipeline inserts
enum class DummyKind {
    Edge,       // One rank-segment of a long edge
    EdgeLabel,  // Segment carrying the edge's label box
    EdgeProxy,  // Temporary rank marker for a label, removed after ranking
    Border,     // Compound node boundary (top, bottom, left or right)
    SelfEdge,   // Placeholder reserving room for a self-loop
    Root        // Nesting graph root
};

enum class BorderSide {
    Left,
    Right
};

const char* toString(LabelPos pos);
std::optional<LabelPos> labelPosFromString(const std::string& text);

/// Per-edge input and output
struct EdgeLabel {
    double width = 0.0;        // Label box
    double height = 0.0;
    LabelPos labelpos = LabelPos::R;
    double labeloffset = 10.0;
    int minlen = 1;            // Minimum rank span
    double weight = 1.0;       // Pull toward a short, straight edge

    // Output
    std::optional<double> x;  // Label centre
    std::optional<double> y;
    std::vector<Point> points;

    // Pipeline bookkeeping
    std::optional<int> labelRank;
    bool nestingEdge = false;
    bool reversed = false;
    std::optional<std::string> forwardName;  // Name before the cycle breaker renamed it
};

struct SelfEdge {
    EdgeKey edgeObj;
    EdgeLabel label;
};

/// Per-node input and output
struct NodeLabel {
    double width = 0.0;
    double height = 0.0;

    // Output, all centre coordinates
    std::optional<double> x;
    std::optional<double> y;
    std::optional<int> rank;
    std::optional<int> order;

    // Pipeline bookkeeping
    std::optional<DummyKind> dummy;
    std::optional<LabelPos> labelpos;       // Label side, for EdgeLabel dummies
    std::optional<EdgeLabel> edgeLabel;     // Label of the edge a dummy stands in for
    std::optional<EdgeKey> edgeObj;
    std::optional<int> minRank;             // Rank span of a compound node
    std::optional<int> maxRank;
    std::optional<BorderSide> borderType;
    std::vector<std::optional<std::string>> borderLeft;   // Indexed by rank
    std::vector<std::optional<std::string>> borderRight;
    std::optional<std::string> borderTop;
    std::optional<std::string> borderBottom;
    std::vector<SelfEdge> selfEdges;

    NodeLabel() = default;
    NodeLabel(double w, double h) : width(w), height(h) {}

    bool isDummy() const { return dummy.has_value(); }
};

/// Graph-level configuration plus bookkeeping shared between phases
struct GraphLabel : LayoutOptions {
    std::vector<std::string> dummyChains;  // Head of each normalized edge chain
    std::optional<std::string> nestingRoot;
    std::optional<int> nodeRankFactor;
};

}  // namespace strata
