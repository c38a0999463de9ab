#include "laneflow/layout/NodeSizer.h"
#include "laneflow/common/Logger.h"

namespace laneflow {

namespace {
constexpr Size DEFAULT_NODE_SIZE = {200.0f, 40.0f};
}

Size NodeSizer::sizeOf(ShapeCategory category) {
    switch (category) {
        case ShapeCategory::Actor: return {40.0f, 60.0f};
        case ShapeCategory::Cloud: return {200.0f, 80.0f};
        case ShapeCategory::Document: return {200.0f, 60.0f};
        case ShapeCategory::Hexagon: return {120.0f, 60.0f};
        case ShapeCategory::Task: return {120.0f, 80.0f};
        case ShapeCategory::Event: return {50.0f, 50.0f};
        case ShapeCategory::Gateway: return {50.0f, 50.0f};
        default: return DEFAULT_NODE_SIZE;
    }
}

bool NodeSizer::hasBottomLabel(ShapeCategory category) {
    return category == ShapeCategory::Event ||
           category == ShapeCategory::Gateway ||
           category == ShapeCategory::Actor;
}

void NodeSizer::apply(Graph& graph) const {
    graph.requireStage(LayoutStage::Built, "NodeSizer");

    size_t bottomLabelCount = 0;
    for (auto& node : graph.nodes()) {
        node.size = sizeOf(node.shape.category);
        node.bottomLabel = hasBottomLabel(node.shape.category);
        if (node.bottomLabel) ++bottomLabelCount;
    }

    graph.setStage(LayoutStage::Sized);
    LOG_DEBUG("Sized {} nodes ({} with bottom labels)", graph.nodeCount(), bottomLabelCount);
}

}  // namespace laneflow
