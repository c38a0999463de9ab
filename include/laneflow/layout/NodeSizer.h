#pragma once

#include "../core/Graph.h"
#include "../core/Shapes.h"
#include "../core/Types.h"

namespace laneflow {

/// First layout pass: fixed per-shape dimensions.
///
/// Standard shapes use a 200x40 box; stencil shapes that look wrong at that
/// size (actor, cloud, document, hexagon and the BPMN task/event/gateway)
/// have their own entry.
class NodeSizer {
public:
    /// Width/height of a shape category
    static Size sizeOf(ShapeCategory category);

    /// True for shapes whose caption renders below the body
    /// (event, gateway, actor)
    static bool hasBottomLabel(ShapeCategory category);

    /// Assign size and bottom-label flag to every node.
    /// Requires LayoutStage::Built, leaves the graph at LayoutStage::Sized.
    void apply(Graph& graph) const;
};

}  // namespace laneflow
