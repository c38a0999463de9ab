#pragma once

#include "../../core/Graph.h"

#include <string>

namespace laneflow {

/// JSON form of a laid-out graph, for downstream serializers and tooling.
///
/// Carries the canvas size, every group rectangle, every node in both
/// coordinate frames (group-local and absolute) with its shape attributes,
/// and every edge with routing case, container, anchors and waypoints
/// (absolute and container-local).
class LayoutSerializer {
public:
    /// @param indent Pretty-print indentation, -1 for a single line
    /// @throws LayoutInvariantViolation if the graph has not been routed
    static std::string toJson(const Graph& graph, int indent = 2);

    /// Write toJson() output to a file
    /// @return true if the file was written
    static bool saveToFile(const Graph& graph, const std::string& path);
};

}  // namespace laneflow
