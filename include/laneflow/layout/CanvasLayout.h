#pragma once

#include "../core/Graph.h"
#include "LayoutOptions.h"

namespace laneflow {

/// Third layout pass: absolute positions for groups and nodes, and the
/// canvas extent.
///
/// Swimlane diagrams place groups side by side along the cross axis (left
/// to right for top-down, top to bottom for left-right), `groupGap` apart,
/// starting at (canvasOrigin, canvasOrigin). Member positions become
/// group position + local position. Ungrouped nodes form a frameless lane
/// after the last group.
///
/// Groupless diagrams are laid out as a simple flowchart: a single stack
/// centered on the widest (top-down) or tallest (left-right) node.
class CanvasLayout {
public:
    /// Requires LayoutStage::Grouped, leaves the graph at LayoutStage::Placed
    void apply(Graph& graph, const LayoutOptions& options) const;

    /// Group origins and absolute member positions
    static void placeGroups(Graph& graph, const LayoutOptions& options);

    /// Frameless lane for ungrouped nodes next to the groups
    static void placeLooseLane(Graph& graph, const LayoutOptions& options);

    /// Groupless stack
    static void placeFlowchart(Graph& graph, const LayoutOptions& options);

    /// Default canvas grown to the content's far edge plus `canvasMargin`,
    /// with `backwardRouteReserve` added along the routing axis when
    /// @p hasBackwardEdges is set.
    static Size canvasSizeFor(const Graph& graph, const LayoutOptions& options, bool hasBackwardEdges);

private:
    static void updateLooseBounds(Graph& graph);
};

}  // namespace laneflow
