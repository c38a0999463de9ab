#include "laneflow/layout/SwimlaneLayout.h"
#include "laneflow/common/Logger.h"

namespace laneflow {

SwimlaneLayout::SwimlaneLayout(const LayoutOptions& options) {
    setOptions(options);
}

void SwimlaneLayout::setOptions(const LayoutOptions& options) {
    options.validate();
    options_ = options;
}

void SwimlaneLayout::layout(Graph& graph) const {
    // Restart the pipeline so a routed graph can be laid out again
    graph.setStage(LayoutStage::Built);

    sizer_.apply(graph);
    groupLayout_.apply(graph, options_);
    canvasLayout_.apply(graph, options_);
    edgeRouter_.apply(graph, options_);

    LOG_INFO("Laid out '{}': {} groups, {} nodes, {} edges, canvas {}x{}",
             graph.title(), graph.groupCount(), graph.nodeCount(), graph.edgeCount(),
             graph.canvasSize().width, graph.canvasSize().height);
}

Graph SwimlaneLayout::layout(const DiagramDescriptor& descriptor) const {
    Graph graph = Graph::fromDescriptor(descriptor);
    layout(graph);
    return graph;
}

}  // namespace laneflow
