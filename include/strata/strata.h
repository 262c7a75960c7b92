#pragma once

/// @file strata.h
/// @brief Main header for the strata layered graph layout library
///
/// strata computes hierarchical (Sugiyama-style) layouts for directed graphs,
/// compound graphs included, with the ordering and positioning rules of dagre.
///
/// Example usage:
/// @code
/// #include <strata/strata.h>
///
/// strata::LayoutGraph graph(strata::GraphOptions{true, true, false});
/// graph.setNode("a", strata::NodeLabel(80, 40));
/// graph.setNode("b", strata::NodeLabel(80, 40));
/// graph.setEdge("a", "b");
///
/// strata::layoutDagreish(graph);
/// double x = *graph.node("b").x;
/// @endcode

// Core module - Graph data structures
#include "core/Types.h"
#include "core/Graph.h"
#include "core/Labels.h"
#include "core/LayoutGraph.h"

// Layout module - Pipelines and their configuration
#include "layout/config/LayoutOptions.h"
#include "layout/ICycleRemoval.h"
#include "layout/ILayerAssignment.h"
#include "layout/ICrossingMinimization.h"
#include "layout/ICoordinateAssignment.h"
#include "layout/SugiyamaLayout.h"
#include "layout/Layout.h"
#include "layout/util/LayoutUtils.h"
#include "layout/util/LayoutSerializer.h"

// Logging
#include "common/Logger.h"

#include <string>

namespace strata {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace strata
