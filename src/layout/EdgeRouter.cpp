#include "laneflow/layout/EdgeRouter.h"
#include "laneflow/common/Logger.h"
#include "laneflow/core/Axis.h"
#include "laneflow/core/Errors.h"
#include "laneflow/core/GeometryUtils.h"

#include <algorithm>
#include <array>

namespace laneflow {

namespace {

AnchorSide primaryLeadingSide(Direction dir) {
    return axis::isVertical(dir) ? AnchorSide::Top : AnchorSide::Left;
}

AnchorSide primaryTrailingSide(Direction dir) {
    return axis::isVertical(dir) ? AnchorSide::Bottom : AnchorSide::Right;
}

AnchorSide crossLeadingSide(Direction dir) {
    return axis::isVertical(dir) ? AnchorSide::Left : AnchorSide::Top;
}

AnchorSide crossTrailingSide(Direction dir) {
    return axis::isVertical(dir) ? AnchorSide::Right : AnchorSide::Bottom;
}

/// Skip routes leave on the side that never carries a caption: right of a
/// vertical stack, above a horizontal one
AnchorSide skipSide(Direction dir) {
    return axis::isVertical(dir) ? AnchorSide::Right : AnchorSide::Top;
}

/// Ordered nodes of the lane @p node lives in
const std::vector<NodeIndex>& laneMembers(const Graph& graph, const NodeData& node) {
    return node.isGrouped() ? graph.group(node.group).members : graph.looseNodes();
}

}  // namespace

void EdgeRouter::apply(Graph& graph, const LayoutOptions& options) const {
    graph.requireStage(LayoutStage::Placed, "EdgeRouter");

    const LaneOrder lanes(graph);
    const float routeLine = backwardRouteLine(graph, options);
    std::array<size_t, 5> caseCounts{};

    for (auto& edge : graph.edges()) {
        const RouteCase routeCase = classifyEdge(graph, lanes, edge.source, edge.target);

        switch (routeCase) {
            case RouteCase::Intra:
                edge.route = routeIntra(graph, edge.source, edge.target);
                break;
            case RouteCase::ForwardCross:
                edge.route = routeForwardCross(graph, edge.source, edge.target);
                break;
            case RouteCase::BackwardCross:
                edge.route = routeBackwardCross(graph, edge.source, edge.target, routeLine);
                break;
            case RouteCase::IntraSkip:
                edge.route = routeIntraSkip(graph, edge.source, edge.target, options);
                verifySkipRoute(graph, edge);
                break;
            case RouteCase::SelfLoop:
                throw LayoutInvariantViolation("self-loop on node '" + graph.node(edge.source).id +
                                               "' reached the edge router");
        }
        ++caseCounts[static_cast<size_t>(routeCase)];

        for (const Point& waypoint : edge.route.waypoints) {
            graph.growCanvasToContain(waypoint, options.backwardEdgeClearance);
        }
    }

    graph.setStage(LayoutStage::Routed);
    LOG_DEBUG("Routed {} edges: {} intra, {} forward, {} backward, {} skip",
              graph.edgeCount(),
              caseCounts[static_cast<size_t>(RouteCase::Intra)],
              caseCounts[static_cast<size_t>(RouteCase::ForwardCross)],
              caseCounts[static_cast<size_t>(RouteCase::BackwardCross)],
              caseCounts[static_cast<size_t>(RouteCase::IntraSkip)]);
}

EdgeRoute EdgeRouter::routeIntra(const Graph& graph, NodeIndex source, NodeIndex target) {
    const Direction dir = graph.direction();
    const NodeData& from = graph.node(source);
    const NodeData& to = graph.node(target);

    EdgeRoute route;
    route.routeCase = RouteCase::Intra;
    route.container = from.group;

    if (from.stackIndex < to.stackIndex) {
        route.sourceSide = primaryTrailingSide(dir);
        route.targetSide = primaryLeadingSide(dir);
    } else {
        route.sourceSide = primaryLeadingSide(dir);
        route.targetSide = primaryTrailingSide(dir);
    }
    return route;
}

EdgeRoute EdgeRouter::routeForwardCross(const Graph& graph, NodeIndex /*source*/, NodeIndex /*target*/) {
    const Direction dir = graph.direction();

    EdgeRoute route;
    route.routeCase = RouteCase::ForwardCross;
    route.sourceSide = crossTrailingSide(dir);
    route.targetSide = crossLeadingSide(dir);
    route.pinned = true;
    return route;
}

EdgeRoute EdgeRouter::routeBackwardCross(const Graph& graph, NodeIndex source, NodeIndex target,
                                         float routeLine) {
    const Direction dir = graph.direction();
    const AnchorSide farSide = primaryTrailingSide(dir);

    const Point exit = anchorPoint(graph.node(source).bounds(), farSide);
    const Point entry = anchorPoint(graph.node(target).bounds(), farSide);

    EdgeRoute route;
    route.routeCase = RouteCase::BackwardCross;
    route.sourceSide = farSide;
    route.targetSide = farSide;
    route.pinned = true;
    route.waypoints = {
        axis::makePoint(routeLine, axis::cross(exit, dir), dir),
        axis::makePoint(routeLine, axis::cross(entry, dir), dir),
    };
    return route;
}

EdgeRoute EdgeRouter::routeIntraSkip(const Graph& graph, NodeIndex source, NodeIndex target,
                                     const LayoutOptions& options) {
    const Direction dir = graph.direction();
    const NodeData& from = graph.node(source);
    const NodeData& to = graph.node(target);
    const AnchorSide side = skipSide(dir);
    const bool trailing = side == crossTrailingSide(dir);

    const auto& members = laneMembers(graph, from);
    const uint32_t lo = std::min(from.stackIndex, to.stackIndex);
    const uint32_t hi = std::max(from.stackIndex, to.stackIndex);

    // Outermost cross edge of every node from source to target inclusive
    float spanEdge = trailing ? axis::crossEnd(from.bounds(), dir) : axis::crossStart(from.bounds(), dir);
    for (uint32_t i = lo; i <= hi; ++i) {
        const Rect bounds = graph.node(members.at(i)).bounds();
        spanEdge = trailing ? std::max(spanEdge, axis::crossEnd(bounds, dir))
                            : std::min(spanEdge, axis::crossStart(bounds, dir));
    }

    float routeCoord;
    if (from.isGrouped()) {
        // Midway between the spanned nodes and the lane border
        const Rect lane = graph.group(from.group).bounds();
        const float laneEdge = trailing ? axis::crossEnd(lane, dir) : axis::crossStart(lane, dir);
        routeCoord = spanEdge + (laneEdge - spanEdge) / 2.0f;
    } else {
        routeCoord = trailing ? spanEdge + options.skipRouteOffset : spanEdge - options.skipRouteOffset;
    }

    const Point exit = anchorPoint(from.bounds(), side);
    const Point entry = anchorPoint(to.bounds(), side);

    EdgeRoute route;
    route.routeCase = RouteCase::IntraSkip;
    route.container = from.group;
    route.sourceSide = side;
    route.targetSide = side;
    route.pinned = true;
    route.waypoints = {
        axis::makePoint(axis::primary(exit, dir), routeCoord, dir),
        axis::makePoint(axis::primary(entry, dir), routeCoord, dir),
    };
    return route;
}

float EdgeRouter::backwardRouteLine(const Graph& graph, const LayoutOptions& options) {
    const Direction dir = graph.direction();

    float farEdge = 0.0f;
    for (const auto& group : graph.groups()) {
        farEdge = std::max(farEdge, axis::primaryEnd(group.bounds(), dir));
    }
    if (!graph.looseBounds().isEmpty()) {
        farEdge = std::max(farEdge, axis::primaryEnd(graph.looseBounds(), dir));
    }
    return farEdge + options.backwardEdgeClearance;
}

std::vector<Point> EdgeRouter::routePolyline(const Graph& graph, const EdgeData& edge) {
    std::vector<Point> points;
    points.reserve(edge.route.waypoints.size() + 2);
    points.push_back(anchorPoint(graph.node(edge.source).bounds(), edge.route.sourceSide));
    points.insert(points.end(), edge.route.waypoints.begin(), edge.route.waypoints.end());
    points.push_back(anchorPoint(graph.node(edge.target).bounds(), edge.route.targetSide));
    return points;
}

void EdgeRouter::verifySkipRoute(const Graph& graph, const EdgeData& edge) {
    const NodeData& from = graph.node(edge.source);
    const NodeData& to = graph.node(edge.target);
    const auto& members = laneMembers(graph, from);
    const uint32_t lo = std::min(from.stackIndex, to.stackIndex);
    const uint32_t hi = std::max(from.stackIndex, to.stackIndex);

    const std::vector<Point> path = routePolyline(graph, edge);
    for (uint32_t i = lo + 1; i < hi; ++i) {
        const NodeData& sibling = graph.node(members.at(i));
        if (geometry::polylinePenetratesRect(path, sibling.bounds())) {
            throw LayoutInvariantViolation("skip route " + from.id + " -> " + to.id +
                                           " crosses sibling '" + sibling.id + "'");
        }
    }
}

}  // namespace laneflow
