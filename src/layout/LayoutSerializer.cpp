#include "laneflow/layout/util/LayoutSerializer.h"
#include "laneflow/common/Logger.h"

#include <nlohmann/json.hpp>

#include <fstream>

using json = nlohmann::json;

namespace laneflow {

namespace {

json pointToJson(const Point& p) {
    return {{"x", p.x}, {"y", p.y}};
}

json rectToJson(const Rect& r) {
    return {{"x", r.x}, {"y", r.y}, {"width", r.width}, {"height", r.height}};
}

json shapeToJson(const ShapeAttributes& shape) {
    json j = {{"category", toString(shape.category)}};
    if (shape.marker) j["marker"] = toString(*shape.marker);
    if (shape.symbol) j["symbol"] = toString(*shape.symbol);
    if (shape.outline) j["outline"] = toString(*shape.outline);
    if (shape.gatewayType) j["gateway_type"] = toString(*shape.gatewayType);
    return j;
}

}  // namespace

std::string LayoutSerializer::toJson(const Graph& graph, int indent) {
    graph.requireStage(LayoutStage::Routed, "LayoutSerializer");

    json j;
    j["version"] = 1;
    j["title"] = graph.title();
    j["direction"] = toString(graph.direction());
    j["canvas"] = {{"width", graph.canvasSize().width}, {"height", graph.canvasSize().height}};

    json groups = json::array();
    for (const auto& group : graph.groups()) {
        json members = json::array();
        for (NodeIndex member : group.members) {
            members.push_back(graph.node(member).id);
        }
        groups.push_back({
            {"id", group.id},
            {"label", group.label},
            {"color", group.color},
            {"bounds", rectToJson(group.bounds())},
            {"members", members}
        });
    }
    j["groups"] = groups;

    json nodes = json::array();
    for (const auto& node : graph.nodes()) {
        json n = {
            {"id", node.id},
            {"label", node.label},
            {"shape", shapeToJson(node.shape)},
            {"bottomLabel", node.bottomLabel},
            {"local", rectToJson(node.localBounds())},
            {"bounds", rectToJson(node.bounds())}
        };
        n["group"] = node.isGrouped() ? json(graph.group(node.group).id) : json(nullptr);
        if (node.color) n["color"] = *node.color;
        nodes.push_back(n);
    }
    j["nodes"] = nodes;

    json edges = json::array();
    for (const auto& edge : graph.edges()) {
        const EdgeRoute& route = edge.route;

        json waypoints = json::array();
        json localWaypoints = json::array();
        for (const auto& wp : route.waypoints) {
            waypoints.push_back(pointToJson(wp));
            localWaypoints.push_back(pointToJson(graph.toContainerLocal(wp, route.container)));
        }

        json e = {
            {"from", graph.node(edge.source).id},
            {"to", graph.node(edge.target).id},
            {"style", toString(edge.style)},
            {"case", toString(route.routeCase)},
            {"sourceSide", toString(route.sourceSide)},
            {"targetSide", toString(route.targetSide)},
            {"pinned", route.pinned},
            {"waypoints", waypoints},
            {"localWaypoints", localWaypoints}
        };
        e["container"] = route.hasGroupContainer() ? json(graph.group(route.container).id) : json(nullptr);
        if (!edge.label.empty()) e["label"] = edge.label;
        edges.push_back(e);
    }
    j["edges"] = edges;

    return j.dump(indent);
}

bool LayoutSerializer::saveToFile(const Graph& graph, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        LOG_ERROR("Cannot open '{}' for writing", path);
        return false;
    }
    file << toJson(graph);
    return file.good();
}

}  // namespace laneflow
