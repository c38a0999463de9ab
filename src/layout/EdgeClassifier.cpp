#include "laneflow/layout/EdgeClassifier.h"
#include "laneflow/core/Errors.h"

#include <algorithm>

namespace laneflow {

LaneOrder::LaneOrder(const Graph& graph)
    : lanes_(graph.nodeCount(), 0),
      looseLane_(static_cast<uint32_t>(graph.groupCount())) {
    for (const auto& node : graph.nodes()) {
        if (!node.isGrouped()) {
            lanes_[node.index] = looseLane_;
            continue;
        }

        const GroupData& group = graph.group(node.group);
        if (std::find(group.members.begin(), group.members.end(), node.index) == group.members.end()) {
            throw UnknownNodeReferenceError(
                "Node '" + node.id + "' resolves to group '" + group.id +
                    "' which does not contain it (" + std::to_string(group.members.size()) + " members)",
                node.id);
        }
        lanes_[node.index] = node.group;
    }
}

RouteCase classifyEdge(const Graph& graph, const LaneOrder& lanes,
                       NodeIndex source, NodeIndex target) {
    if (source == target) {
        return RouteCase::SelfLoop;
    }

    const uint32_t sourceLane = lanes.laneOf(source);
    const uint32_t targetLane = lanes.laneOf(target);

    if (sourceLane == targetLane) {
        const uint32_t a = graph.node(source).stackIndex;
        const uint32_t b = graph.node(target).stackIndex;
        const uint32_t distance = a > b ? a - b : b - a;
        return distance > 1 ? RouteCase::IntraSkip : RouteCase::Intra;
    }

    return targetLane > sourceLane ? RouteCase::ForwardCross : RouteCase::BackwardCross;
}

bool hasBackwardEdges(const Graph& graph, const LaneOrder& lanes) {
    return std::any_of(graph.edges().begin(), graph.edges().end(), [&](const EdgeData& edge) {
        return classifyEdge(graph, lanes, edge.source, edge.target) == RouteCase::BackwardCross;
    });
}

}  // namespace laneflow
