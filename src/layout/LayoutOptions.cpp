#include "laneflow/layout/LayoutOptions.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace laneflow {

namespace {

void requireNonNegative(float value, const char* name) {
    if (!(value >= 0.0f) || !std::isfinite(value)) {
        throw std::invalid_argument(std::string("LayoutOptions.") + name +
                                    " must be a finite non-negative value");
    }
}

void requirePositive(float value, const char* name) {
    if (!(value > 0.0f) || !std::isfinite(value)) {
        throw std::invalid_argument(std::string("LayoutOptions.") + name +
                                    " must be a finite positive value");
    }
}

}  // namespace

void LayoutOptions::validate() const {
    requireNonNegative(nodeGap, "nodeGap");
    requireNonNegative(bottomLabelPadding, "bottomLabelPadding");
    requireNonNegative(groupHeaderSize, "groupHeaderSize");
    requirePositive(defaultGroupWidth, "defaultGroupWidth");
    requirePositive(defaultGroupHeight, "defaultGroupHeight");
    requireNonNegative(groupCrossPadding, "groupCrossPadding");

    requireNonNegative(groupGap, "groupGap");
    requireNonNegative(canvasOrigin, "canvasOrigin");
    requireNonNegative(flowchartOrigin, "flowchartOrigin");
    requireNonNegative(canvasMargin, "canvasMargin");
    requirePositive(defaultCanvas.width, "defaultCanvas.width");
    requirePositive(defaultCanvas.height, "defaultCanvas.height");

    // A zero clearance would put the backward routing line on a group border
    requirePositive(backwardEdgeClearance, "backwardEdgeClearance");
    requireNonNegative(backwardRouteReserve, "backwardRouteReserve");
    requirePositive(skipRouteOffset, "skipRouteOffset");
}

}  // namespace laneflow
