#include "laneflow/layout/CanvasLayout.h"
#include "laneflow/common/Logger.h"
#include "laneflow/core/Axis.h"
#include "laneflow/layout/EdgeClassifier.h"
#include "laneflow/layout/NodeSizer.h"

#include <algorithm>

namespace laneflow {

void CanvasLayout::apply(Graph& graph, const LayoutOptions& options) const {
    graph.requireStage(LayoutStage::Grouped, "CanvasLayout");

    if (graph.hasGroups()) {
        placeGroups(graph, options);
        placeLooseLane(graph, options);
    } else {
        placeFlowchart(graph, options);
    }
    updateLooseBounds(graph);

    LaneOrder lanes(graph);
    const bool backward = hasBackwardEdges(graph, lanes);
    graph.setCanvasSize(canvasSizeFor(graph, options, backward));

    graph.setStage(LayoutStage::Placed);
    LOG_DEBUG("Placed {} groups and {} loose nodes on a {}x{} canvas{}",
              graph.groupCount(), graph.looseNodes().size(),
              graph.canvasSize().width, graph.canvasSize().height,
              backward ? " (backward routing reserve)" : "");
}

void CanvasLayout::placeGroups(Graph& graph, const LayoutOptions& options) {
    const Direction dir = graph.direction();
    float cursor = options.canvasOrigin;

    for (auto& group : graph.groups()) {
        group.position = axis::makePoint(options.canvasOrigin, cursor, dir);
        cursor += axis::cross(group.size, dir) + options.groupGap;

        for (NodeIndex member : group.members) {
            NodeData& node = graph.node(member);
            node.position = group.position + node.localPosition;
        }
    }
}

void CanvasLayout::placeLooseLane(Graph& graph, const LayoutOptions& options) {
    const Direction dir = graph.direction();
    if (graph.looseNodes().empty()) {
        return;
    }

    float laneStart = options.canvasOrigin;
    if (graph.hasGroups()) {
        const GroupData& last = graph.groups().back();
        laneStart = axis::crossEnd(last.bounds(), dir) + options.groupGap;
    }

    float widest = 0.0f;
    for (NodeIndex index : graph.looseNodes()) {
        widest = std::max(widest, axis::cross(graph.node(index).size, dir));
    }

    // Same stacking rule as inside a group, header band included, so loose
    // nodes line up with the first member of each lane
    float cursor = options.canvasOrigin + options.groupHeaderSize + options.nodeGap;
    for (NodeIndex index : graph.looseNodes()) {
        NodeData& node = graph.node(index);
        const float offset = (widest - axis::cross(node.size, dir)) / 2.0f;

        node.position = axis::makePoint(cursor, laneStart + offset, dir);
        node.localPosition = node.position;

        cursor += axis::primary(node.size, dir) + options.nodeGap;
        if (node.bottomLabel) {
            cursor += options.bottomLabelPadding;
        }
    }
}

void CanvasLayout::placeFlowchart(Graph& graph, const LayoutOptions& options) {
    const Direction dir = graph.direction();

    // The centering line never sits closer than half a default box
    float widest = axis::cross(NodeSizer::sizeOf(ShapeCategory::Rectangle), dir);
    for (const auto& node : graph.nodes()) {
        widest = std::max(widest, axis::cross(node.size, dir));
    }

    float cursor = options.canvasOrigin;
    for (NodeIndex index : graph.looseNodes()) {
        NodeData& node = graph.node(index);
        const float offset = (widest - axis::cross(node.size, dir)) / 2.0f;

        node.position = axis::makePoint(cursor, options.flowchartOrigin + offset, dir);
        node.localPosition = node.position;

        cursor += axis::primary(node.size, dir) + options.groupGap;
        // Captions hang below the body; only a vertical stack needs room for them
        if (node.bottomLabel && axis::isVertical(dir)) {
            cursor += options.bottomLabelPadding;
        }
    }
}

Size CanvasLayout::canvasSizeFor(const Graph& graph, const LayoutOptions& options, bool hasBackwardEdges) {
    Size canvas = options.defaultCanvas;

    const Rect content = graph.contentBounds();
    if (!content.isEmpty()) {
        canvas.width = std::max(canvas.width, content.right() + options.canvasMargin);
        canvas.height = std::max(canvas.height, content.bottom() + options.canvasMargin);
    }

    if (hasBackwardEdges) {
        if (axis::isVertical(graph.direction())) {
            canvas.height += options.backwardRouteReserve;
        } else {
            canvas.width += options.backwardRouteReserve;
        }
    }
    return canvas;
}

void CanvasLayout::updateLooseBounds(Graph& graph) {
    Rect bounds;
    for (NodeIndex index : graph.looseNodes()) {
        bounds = bounds.united(graph.node(index).bounds());
    }
    graph.setLooseBounds(bounds);
}

}  // namespace laneflow
