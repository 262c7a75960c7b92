#pragma once

#include "strata/core/LayoutGraph.h"

namespace strata {
namespace algorithms {

/// Positioning always works top to bottom. adjust() swaps node and label
/// boxes for horizontal directions; undo() maps coordinates back to rankdir.
class CoordinateSystem {
public:
    static void adjust(LayoutGraph& g);
    static void undo(LayoutGraph& g);

private:
    static void swapWidthHeight(LayoutGraph& g);
    static void reverseY(LayoutGraph& g);
    static void swapXY(LayoutGraph& g);
};

}  // namespace algorithms
}  // namespace strata
