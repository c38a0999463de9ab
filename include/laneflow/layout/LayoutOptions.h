#pragma once

#include "../core/Types.h"

namespace laneflow {

/// Tunable layout constants.
///
/// All values are in diagram units. Primary/cross refer to the stacking axis
/// inside a group (see core/Axis.h); "height" and "width" defaults are the
/// values for a top-down diagram and swap roles in a left-right one.
struct LayoutOptions {
    // Group Layout
    float nodeGap = 20.0f;                 ///< Gap between stacked nodes (and after the header band)
    float bottomLabelPadding = 25.0f;      ///< Extra trailing gap after a bottom-label node
    float groupHeaderSize = 30.0f;         ///< Title band of a swimlane
    float defaultGroupWidth = 280.0f;      ///< Cross-axis floor (top-down)
    float defaultGroupHeight = 200.0f;     ///< Primary-axis floor (top-down)
    float groupCrossPadding = 20.0f;       ///< Minimum margin between a node and its lane's sides

    // Canvas Layout
    float groupGap = 60.0f;                ///< Gap between groups, and between loose flowchart nodes
    float canvasOrigin = 40.0f;            ///< Offset of the first group from the canvas corner
    float flowchartOrigin = 100.0f;        ///< Centering origin of a groupless flowchart
    float canvasMargin = 100.0f;           ///< Free space kept past the far content edge
    Size defaultCanvas = {1200.0f, 800.0f};

    // Edge Router
    float backwardEdgeClearance = 40.0f;   ///< Distance of the backward routing line past all groups
    float backwardRouteReserve = 80.0f;    ///< Canvas growth reserved for backward routing lines
    float skipRouteOffset = 20.0f;         ///< Skip-route distance beside loose (frameless) stacks

    /// Primary-axis floor of a group for @p direction
    float defaultGroupPrimary(Direction direction) const {
        return direction == Direction::TopDown ? defaultGroupHeight : defaultGroupWidth;
    }

    /// Cross-axis floor of a group for @p direction
    float defaultGroupCross(Direction direction) const {
        return direction == Direction::TopDown ? defaultGroupWidth : defaultGroupHeight;
    }

    /// @throws std::invalid_argument if any spacing is negative or a size is not positive
    void validate() const;
};

}  // namespace laneflow
