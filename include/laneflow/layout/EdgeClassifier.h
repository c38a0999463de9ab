#pragma once

#include "../core/Graph.h"

#include <vector>

namespace laneflow {

/// Canvas order of the lanes a node can live in.
///
/// Groups take their input index; loose nodes in a swimlane diagram share
/// the trailing lane `groupCount`. In a groupless flowchart every node sits
/// in lane 0. Built once per routing pass so classification is O(1).
class LaneOrder {
public:
    /// @throws UnknownNodeReferenceError if a node claims a group that does
    ///         not list it (an empty group cannot own a node)
    explicit LaneOrder(const Graph& graph);

    uint32_t laneOf(NodeIndex node) const { return lanes_.at(node); }
    uint32_t looseLane() const { return looseLane_; }

private:
    std::vector<uint32_t> lanes_;
    uint32_t looseLane_ = 0;
};

/// Pure routing-case decision for one connection, evaluated in priority order:
/// self-loop, same lane (skip when siblings sit in between, intra otherwise),
/// forward when the target lane follows the source lane, backward otherwise.
RouteCase classifyEdge(const Graph& graph, const LaneOrder& lanes,
                       NodeIndex source, NodeIndex target);

/// True if any connection of the graph is a backward cross-lane edge
bool hasBackwardEdges(const Graph& graph, const LaneOrder& lanes);

}  // namespace laneflow
