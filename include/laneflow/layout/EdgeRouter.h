#pragma once

#include "../core/Graph.h"
#include "EdgeClassifier.h"
#include "LayoutOptions.h"

#include <vector>

namespace laneflow {

/// Fourth layout pass: anchor sides and explicit waypoints per connection.
///
/// Every connection is classified once (see classifyEdge()) and handed to
/// the route builder for its case. Builders are pure functions of the
/// placed graph; no collision search takes place.
///
/// | Case     | Top-down anchors  | Left-right anchors | Waypoints                   |
/// |----------|-------------------|--------------------|-----------------------------|
/// | Intra    | facing, primary   | facing, primary    | none, left to the exporter  |
/// | Forward  | Right -> Left     | Bottom -> Top      | none                        |
/// | Backward | Bottom -> Bottom  | Right -> Right     | pair on the clearance line  |
/// | Skip     | Right -> Right    | Top -> Top         | pair in the lane margin     |
class EdgeRouter {
public:
    /// Requires LayoutStage::Placed, leaves the graph at LayoutStage::Routed.
    /// The canvas grows if any waypoint would fall outside it.
    /// @throws UnknownNodeReferenceError for a node its group does not list
    /// @throws LayoutInvariantViolation for a self-loop or a skip route that
    ///         crosses a skipped sibling
    void apply(Graph& graph, const LayoutOptions& options) const;

    /// Adjacent nodes of one lane: anchors face each other along the primary axis
    static EdgeRoute routeIntra(const Graph& graph, NodeIndex source, NodeIndex target);

    /// Source trailing side to target leading side across the lane gap
    static EdgeRoute routeForwardCross(const Graph& graph, NodeIndex source, NodeIndex target);

    /// Far side to far side via two waypoints on @p routeLine, a primary-axis
    /// coordinate past every group
    static EdgeRoute routeBackwardCross(const Graph& graph, NodeIndex source, NodeIndex target,
                                        float routeLine);

    /// Around the siblings stacked between source and target, through the
    /// lane margin beside them
    static EdgeRoute routeIntraSkip(const Graph& graph, NodeIndex source, NodeIndex target,
                                    const LayoutOptions& options);

    /// Primary-axis coordinate of the backward routing line:
    /// max(group and loose-node far edges) + backwardEdgeClearance
    static float backwardRouteLine(const Graph& graph, const LayoutOptions& options);

    /// Full connector path in absolute coordinates: source anchor, waypoints,
    /// target anchor
    static std::vector<Point> routePolyline(const Graph& graph, const EdgeData& edge);

private:
    static void verifySkipRoute(const Graph& graph, const EdgeData& edge);
};

}  // namespace laneflow
