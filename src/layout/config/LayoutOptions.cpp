#include "strata/layout/config/LayoutOptions.h"

namespace strata {

const char* toString(Direction dir) {
    switch (dir) {
        case Direction::TopToBottom: return "TB";
        case Direction::BottomToTop: return "BT";
        case Direction::LeftToRight: return "LR";
        case Direction::RightToLeft: return "RL";
    }
    return "TB";
}

std::optional<Direction> directionFromString(const std::string& text) {
    if (text == "TB" || text == "tb") return Direction::TopToBottom;
    if (text == "BT" || text == "bt") return Direction::BottomToTop;
    if (text == "LR" || text == "lr") return Direction::LeftToRight;
    if (text == "RL" || text == "rl") return Direction::RightToLeft;
    return std::nullopt;
}

const char* toString(RankingStrategy ranker) {
    switch (ranker) {
        case RankingStrategy::NetworkSimplex: return "network-simplex";
        case RankingStrategy::TightTree: return "tight-tree";
        case RankingStrategy::LongestPath: return "longest-path";
        case RankingStrategy::None: return "none";
    }
    return "network-simplex";
}

std::optional<RankingStrategy> rankingStrategyFromString(const std::string& text) {
    if (text == "network-simplex") return RankingStrategy::NetworkSimplex;
    if (text == "tight-tree") return RankingStrategy::TightTree;
    if (text == "longest-path") return RankingStrategy::LongestPath;
    if (text == "none") return RankingStrategy::None;
    return std::nullopt;
}

const char* toString(Alignment align) {
    switch (align) {
        case Alignment::UL: return "UL";
        case Alignment::UR: return "UR";
        case Alignment::DL: return "DL";
        case Alignment::DR: return "DR";
    }
    return "UL";
}

std::optional<Alignment> alignmentFromString(const std::string& text) {
    if (text == "UL" || text == "ul") return Alignment::UL;
    if (text == "UR" || text == "ur") return Alignment::UR;
    if (text == "DL" || text == "dl") return Alignment::DL;
    if (text == "DR" || text == "dr") return Alignment::DR;
    return std::nullopt;
}

}  // namespace strata
