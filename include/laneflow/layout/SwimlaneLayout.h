#pragma once

#include "../core/Descriptors.h"
#include "../core/Graph.h"
#include "CanvasLayout.h"
#include "EdgeRouter.h"
#include "GroupLayout.h"
#include "LayoutOptions.h"
#include "NodeSizer.h"

namespace laneflow {

/// Rule-based swimlane layout.
///
/// Runs the four passes in strict order on a Graph:
/// 1. NodeSizer - fixed size per shape category
/// 2. GroupLayout - stack, equalize and center group members
/// 3. CanvasLayout - absolute positions and canvas extent
/// 4. EdgeRouter - anchor sides and waypoints per connection
///
/// The layout holds only its options; every call works on the caller's Graph,
/// so independent diagrams can be laid out concurrently.
class SwimlaneLayout {
public:
    SwimlaneLayout() = default;

    /// @throws std::invalid_argument if the options fail LayoutOptions::validate()
    explicit SwimlaneLayout(const LayoutOptions& options);

    /// @throws std::invalid_argument if the options fail LayoutOptions::validate()
    void setOptions(const LayoutOptions& options);
    const LayoutOptions& options() const { return options_; }

    /// Lay out a graph in place. Any previous layout is recomputed from scratch.
    void layout(Graph& graph) const;

    /// Build a graph from descriptors and lay it out.
    /// @throws StructuralInputError (or a subclass) for rejected input
    Graph layout(const DiagramDescriptor& descriptor) const;

private:
    LayoutOptions options_;
    NodeSizer sizer_;
    GroupLayout groupLayout_;
    CanvasLayout canvasLayout_;
    EdgeRouter edgeRouter_;
};

}  // namespace laneflow
