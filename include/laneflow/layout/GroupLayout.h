#pragma once

#include "../core/Graph.h"
#include "LayoutOptions.h"

namespace laneflow {

/// Second layout pass: arranges member nodes inside each group and
/// normalizes group dimensions.
///
/// 1. Stack members along the primary axis in input order, `nodeGap` apart,
///    with `bottomLabelPadding` extra after every bottom-label node.
/// 2. Raw primary extent = header band + stacked members + trailing gap,
///    floored at the default group size.
/// 3. Cross extent = default group size, grown to fit the widest member plus
///    `groupCrossPadding` on both sides.
/// 4. Equalize: every group takes the largest primary extent. This runs only
///    after all raw extents are known.
/// 5. Center each member on the cross axis.
///
/// Node positions written here are group-local (NodeData::localPosition).
/// Loose nodes are left to CanvasLayout.
class GroupLayout {
public:
    /// Requires LayoutStage::Sized, leaves the graph at LayoutStage::Grouped
    void apply(Graph& graph, const LayoutOptions& options) const;

    /// Steps 1-3 for one group. Writes member primary offsets and the group's
    /// raw size; returns the raw primary extent.
    static float stackMembers(Graph& graph, GroupIndex group, const LayoutOptions& options);

    /// Step 4. Sets every group's primary extent to the maximum over all
    /// groups and returns it. Idempotent.
    static float equalizeGroupExtents(Graph& graph);

    /// Step 5. Cross-axis offset of each member: (group cross - node cross) / 2
    static void centerMembers(Graph& graph, GroupIndex group);

private:
    static void verifyGroup(const Graph& graph, const GroupData& group);
};

}  // namespace laneflow
