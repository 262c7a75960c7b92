#pragma once

#include "strata/core/LayoutGraph.h"

#include <optional>
#include <string>
#include <unordered_map>

namespace strata {

/// Result of coordinate assignment
struct CoordinateAssignmentResult {
    std::unordered_map<std::string, double> xs;  ///< Centre x of each positioned node
    std::optional<Alignment> alignment;          ///< Single alignment used, if any
};

/// Abstract interface for placing ordered ranks in the plane
///
/// The graph handed in is ranked, ordered and laid out top to bottom. Compound
/// nodes, if any, carry only their border dummies. Implementations write the
/// centre x and y of every ranked node and must keep each rank in order without
/// overlap.
class ICoordinateAssignment {
public:
    virtual ~ICoordinateAssignment() = default;

    virtual CoordinateAssignmentResult assign(LayoutGraph& graph) const = 0;

    /// Name used in log output
    virtual const char* algorithmName() const = 0;
};

}  // namespace strata
