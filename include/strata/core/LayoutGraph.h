#pragma once

#include "strata/core/Graph.h"
#include "strata/core/Labels.h"

namespace strata {

extern template class BasicGraph<NodeLabel, EdgeLabel, GraphLabel>;

/// The graph every layout phase reads and mutates in place
using LayoutGraph = BasicGraph<NodeLabel, EdgeLabel, GraphLabel>;

}  // namespace strata
