#pragma once

#include <optional>
#include <string>

namespace strata {

/// Direction ranks advance in (dagre's rankdir)
enum class Direction {
    TopToBottom,   // "TB", rank 0 at the top
    BottomToTop,   // "BT"
    LeftToRight,   // "LR"
    RightToLeft    // "RL"
};

/// Feedback arc set heuristic used to make the graph acyclic
enum class CycleRemovalStrategy {
    DepthFirst,  // Back edges of a DFS in node order
    Greedy       // Eades-Lin-Smyth bucket heuristic
};

/// Rank assignment algorithm
enum class RankingStrategy {
    NetworkSimplex,  // Optimal total edge length
    TightTree,       // Longest path, then a feasible tight tree
    LongestPath,     // Fast, pushes nodes toward the sinks
    None             // Keep ranks already present on the nodes
};

/// Single Brandes-Koepf alignment, instead of balancing all four
enum class Alignment { UL, UR, DL, DR };

/// Graph-level layout configuration
struct LayoutOptions {
    Direction rankdir = Direction::TopToBottom;

    double nodesep = 50.0;  // Between adjacent nodes of a rank
    double ranksep = 50.0;  // Between adjacent ranks
    double edgesep = 20.0;  // Between adjacent dummy nodes
    double marginx = 0.0;
    double marginy = 0.0;

    CycleRemovalStrategy acyclicer = CycleRemovalStrategy::DepthFirst;
    RankingStrategy ranker = RankingStrategy::NetworkSimplex;
    std::optional<Alignment> align;

    bool isHorizontal() const {
        return rankdir == Direction::LeftToRight || rankdir == Direction::RightToLeft;
    }
};

const char* toString(Direction dir);
std::optional<Direction> directionFromString(const std::string& text);

const char* toString(RankingStrategy ranker);
std::optional<RankingStrategy> rankingStrategyFromString(const std::string& text);

const char* toString(Alignment align);
std::optional<Alignment> alignmentFromString(const std::string& text);

}  // namespace strata
