#include "laneflow/layout/GroupLayout.h"
#include "laneflow/common/Logger.h"
#include "laneflow/core/Axis.h"
#include "laneflow/core/Errors.h"

#include <algorithm>

namespace laneflow {

void GroupLayout::apply(Graph& graph, const LayoutOptions& options) const {
    graph.requireStage(LayoutStage::Sized, "GroupLayout");
    graph.setGroupHeaderSize(options.groupHeaderSize);

    // Raw extents for every group first: equalization needs all of them
    for (GroupIndex g = 0; g < graph.groupCount(); ++g) {
        stackMembers(graph, g, options);
    }

    float maxPrimary = equalizeGroupExtents(graph);

    for (GroupIndex g = 0; g < graph.groupCount(); ++g) {
        centerMembers(graph, g);
        verifyGroup(graph, graph.group(g));
    }

    graph.setStage(LayoutStage::Grouped);
    LOG_DEBUG("Laid out {} groups, equalized primary extent {}", graph.groupCount(), maxPrimary);
}

float GroupLayout::stackMembers(Graph& graph, GroupIndex groupIndex, const LayoutOptions& options) {
    const Direction dir = graph.direction();
    GroupData& group = graph.group(groupIndex);

    float cursor = options.groupHeaderSize + options.nodeGap;
    float widestMember = 0.0f;

    for (NodeIndex member : group.members) {
        NodeData& node = graph.node(member);
        const float nodePrimary = axis::primary(node.size, dir);

        node.localPosition = axis::makePoint(cursor, 0.0f, dir);

        cursor += nodePrimary + options.nodeGap;
        if (node.bottomLabel) {
            cursor += options.bottomLabelPadding;
        }
        widestMember = std::max(widestMember, axis::cross(node.size, dir));
    }

    // An empty group still reserves its header band
    float rawPrimary = cursor + options.nodeGap;
    if (group.empty()) {
        rawPrimary = options.groupHeaderSize + 2.0f * options.nodeGap;
    }
    rawPrimary = std::max(options.defaultGroupPrimary(dir), rawPrimary);

    float crossExtent = std::max(options.defaultGroupCross(dir),
                                 widestMember + 2.0f * options.groupCrossPadding);

    group.size = axis::makeSize(rawPrimary, crossExtent, dir);
    return rawPrimary;
}

float GroupLayout::equalizeGroupExtents(Graph& graph) {
    const Direction dir = graph.direction();

    float maxPrimary = 0.0f;
    for (const auto& group : graph.groups()) {
        maxPrimary = std::max(maxPrimary, axis::primary(group.size, dir));
    }

    for (auto& group : graph.groups()) {
        group.size = axis::makeSize(maxPrimary, axis::cross(group.size, dir), dir);
    }

    return maxPrimary;
}

void GroupLayout::centerMembers(Graph& graph, GroupIndex groupIndex) {
    const Direction dir = graph.direction();
    const GroupData& group = graph.group(groupIndex);
    const float groupCross = axis::cross(group.size, dir);

    for (NodeIndex member : group.members) {
        NodeData& node = graph.node(member);
        float offset = (groupCross - axis::cross(node.size, dir)) / 2.0f;
        node.localPosition = axis::makePoint(axis::primary(node.localPosition, dir), offset, dir);
    }
}

void GroupLayout::verifyGroup(const Graph& graph, const GroupData& group) {
    const Direction dir = graph.direction();
    const float groupPrimary = axis::primary(group.size, dir);
    const float groupCross = axis::cross(group.size, dir);

    if (groupPrimary <= 0.0f || groupCross <= 0.0f) {
        throw LayoutInvariantViolation("group '" + group.id + "' has a non-positive extent");
    }

    for (NodeIndex member : group.members) {
        const NodeData& node = graph.node(member);
        const float offset = axis::cross(node.localPosition, dir);
        if (offset < 0.0f || offset + axis::cross(node.size, dir) > groupCross) {
            throw LayoutInvariantViolation("node '" + node.id + "' exceeds the cross extent of group '" +
                                           group.id + "'");
        }
        if (axis::primary(node.localPosition, dir) + axis::primary(node.size, dir) > groupPrimary) {
            throw LayoutInvariantViolation("node '" + node.id + "' exceeds the primary extent of group '" +
                                           group.id + "'");
        }
    }
}

}  // namespace laneflow
