#include "strata/core/LayoutGraph.h"

namespace strata {

template class BasicGraph<NodeLabel, EdgeLabel, GraphLabel>;

const char* toString(LabelPos pos) {
    switch (pos) {
        case LabelPos::L: return "l";
        case LabelPos::C: return "c";
        case LabelPos::R: return "r";
    }
    return "c";
}

std::optional<LabelPos> labelPosFromString(const std::string& text) {
    if (text == "l" || text == "L") return LabelPos::L;
    if (text == "c" || text == "C") return LabelPos::C;
    if (text == "r" || text == "R") return LabelPos::R;
    return std::nullopt;
}

}  // namespace strata
