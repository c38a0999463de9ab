#include "laneflow/core/Graph.h"
#include "laneflow/common/Logger.h"
#include "laneflow/core/Errors.h"

#include <algorithm>

namespace laneflow {

const char* toString(RouteCase routeCase) {
    switch (routeCase) {
        case RouteCase::Intra: return "intra";
        case RouteCase::ForwardCross: return "forward";
        case RouteCase::BackwardCross: return "backward";
        case RouteCase::IntraSkip: return "skip";
        case RouteCase::SelfLoop: return "self-loop";
    }
    return "intra";
}

const char* toString(LayoutStage stage) {
    switch (stage) {
        case LayoutStage::Built: return "built";
        case LayoutStage::Sized: return "sized";
        case LayoutStage::Grouped: return "grouped";
        case LayoutStage::Placed: return "placed";
        case LayoutStage::Routed: return "routed";
    }
    return "built";
}

Graph::Graph(Direction direction)
    : direction_(direction) {}

Graph Graph::fromDescriptor(const DiagramDescriptor& descriptor) {
    Graph graph(descriptor.direction);
    graph.setTitle(descriptor.title);

    try {
        for (const auto& group : descriptor.groups) {
            graph.addGroup(group);
        }
        for (const auto& node : descriptor.nodes) {
            graph.addNode(node);
        }
        for (const auto& connection : descriptor.connections) {
            graph.addEdge(connection);
        }
    } catch (const StructuralInputError& e) {
        LOG_WARN("Rejected diagram '{}': {}", descriptor.title, e.what());
        throw;
    }

    LOG_DEBUG("Built graph '{}': {} groups, {} nodes, {} edges, direction {}",
              graph.title(), graph.groupCount(), graph.nodeCount(),
              graph.edgeCount(), toString(graph.direction()));
    return graph;
}

GroupIndex Graph::addGroup(const GroupDescriptor& descriptor) {
    if (groupIds_.count(descriptor.id)) {
        throw DuplicateGroupError(descriptor.id);
    }

    GroupData data;
    data.index = static_cast<GroupIndex>(groups_.size());
    data.id = descriptor.id;
    data.label = descriptor.label.empty() ? descriptor.id : descriptor.label;
    data.color = descriptor.color;

    groupIds_[data.id] = data.index;
    groups_.push_back(std::move(data));
    stage_ = LayoutStage::Built;
    return groups_.back().index;
}

NodeIndex Graph::addNode(const NodeDescriptor& descriptor) {
    if (nodeIds_.count(descriptor.id)) {
        throw DuplicateNodeError(descriptor.id);
    }

    GroupIndex owner = INVALID_GROUP;
    if (descriptor.group.has_value()) {
        auto found = findGroup(*descriptor.group);
        if (!found) {
            throw UnknownNodeReferenceError(
                "Node '" + descriptor.id + "' references unknown group: '" + *descriptor.group + "'",
                *descriptor.group);
        }
        owner = *found;
    }

    NodeData data;
    data.index = static_cast<NodeIndex>(nodes_.size());
    data.id = descriptor.id;
    data.label = descriptor.label.empty() ? descriptor.id : descriptor.label;
    data.color = descriptor.color;
    data.shape = resolveShapeAttributes(descriptor.id, descriptor.shape);
    data.group = owner;

    if (owner != INVALID_GROUP) {
        auto& members = groups_[owner].members;
        data.stackIndex = static_cast<uint32_t>(members.size());
        members.push_back(data.index);
    } else {
        data.stackIndex = static_cast<uint32_t>(looseNodes_.size());
        looseNodes_.push_back(data.index);
    }

    nodeIds_[data.id] = data.index;
    nodes_.push_back(std::move(data));
    stage_ = LayoutStage::Built;
    return nodes_.back().index;
}

EdgeIndex Graph::addEdge(const ConnectionDescriptor& descriptor) {
    auto source = findNode(descriptor.from);
    if (!source) {
        throw UnknownNodeReferenceError(
            "Connection 'from' references unknown node: '" + descriptor.from + "'", descriptor.from);
    }
    auto target = findNode(descriptor.to);
    if (!target) {
        throw UnknownNodeReferenceError(
            "Connection 'to' references unknown node: '" + descriptor.to + "'", descriptor.to);
    }
    if (*source == *target) {
        throw UnsupportedSelfLoopError(descriptor.from);
    }

    EdgeData data;
    data.index = static_cast<EdgeIndex>(edges_.size());
    data.source = *source;
    data.target = *target;
    data.label = descriptor.label;
    data.style = descriptor.style;

    edges_.push_back(std::move(data));
    stage_ = LayoutStage::Built;
    return edges_.back().index;
}

std::optional<NodeIndex> Graph::findNode(const std::string& id) const {
    auto it = nodeIds_.find(id);
    if (it == nodeIds_.end()) return std::nullopt;
    return it->second;
}

std::optional<GroupIndex> Graph::findGroup(const std::string& id) const {
    auto it = groupIds_.find(id);
    if (it == groupIds_.end()) return std::nullopt;
    return it->second;
}

NodeIndex Graph::nodeIndex(const std::string& id) const {
    auto index = findNode(id);
    if (!index) {
        throw UnknownNodeReferenceError("Unknown node id: '" + id + "'", id);
    }
    return *index;
}

GroupIndex Graph::groupIndex(const std::string& id) const {
    auto index = findGroup(id);
    if (!index) {
        throw UnknownNodeReferenceError("Unknown group id: '" + id + "'", id);
    }
    return *index;
}

void Graph::growCanvasToContain(const Point& point, float margin) {
    canvasSize_.width = std::max(canvasSize_.width, point.x + margin);
    canvasSize_.height = std::max(canvasSize_.height, point.y + margin);
}

Rect Graph::contentBounds() const {
    Rect bounds;
    for (const auto& group : groups_) {
        bounds = bounds.united(group.bounds());
    }
    for (const auto& node : nodes_) {
        bounds = bounds.united(node.bounds());
    }
    return bounds;
}

Rect Graph::containerBounds(GroupIndex container) const {
    if (container == INVALID_GROUP) {
        return {Point{0.0f, 0.0f}, canvasSize_};
    }
    return group(container).bounds();
}

Point Graph::toContainerLocal(const Point& absolute, GroupIndex container) const {
    if (container == INVALID_GROUP) {
        return absolute;
    }
    return absolute - group(container).position;
}

void Graph::requireStage(LayoutStage required, const char* pass) const {
    if (stage_ < required) {
        throw LayoutInvariantViolation(
            std::string(pass) + " requires stage '" + toString(required) +
            "' but graph is at '" + toString(stage_) + "'");
    }
}

}  // namespace laneflow
