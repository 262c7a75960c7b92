#pragma once

#include "strata/core/LayoutGraph.h"
#include "strata/layout/config/LayoutOptions.h"

#include <optional>
#include <string>

namespace strata {

/// JSON form of layout options and of whole graphs, for fixtures and tools
///
/// Graph documents look like
/// { "options": {...}, "graph": {"multigraph", "compound"},
///   "nodes": [{id, width, height, parent?, x?, y?, rank?, order?}],
///   "edges": [{v, w, name?, weight, minlen, width, height, labelpos,
///              labeloffset, points?, x?, y?}] }
class LayoutSerializer {
public:
    // === Options ===

    static std::string optionsToJson(const LayoutOptions& options);

    /// Missing keys keep their defaults; unknown keys are ignored
    /// @return std::nullopt if the text is not a JSON object
    static std::optional<LayoutOptions> optionsFromJson(const std::string& json);

    // === Graphs ===

    /// Serialize a graph with its labels and any layout results
    static std::string toJson(const LayoutGraph& graph);

    /// Parse a graph document. Nodes are added before parents and edges, so
    /// the order of the arrays is the only order that matters.
    /// @return std::nullopt on malformed JSON, an edge to an undeclared node,
    ///         or a parent cycle; the reason is logged
    static std::optional<LayoutGraph> graphFromJson(const std::string& json);

    /// Save a graph document to file
    /// @return true if save succeeded
    static bool saveToFile(const LayoutGraph& graph, const std::string& path);

    /// Load a graph document from file
    static std::optional<LayoutGraph> loadFromFile(const std::string& path);
};

}  // namespace strata
