#pragma once

/// @file laneflow.h
/// @brief Main header for the laneflow swimlane diagram library
///
/// laneflow turns a structured diagram description (groups, nodes and
/// connections) into a positioned, routed graph and writes it as a draw.io
/// document or an SVG preview.
///
/// Example usage:
/// @code
/// #include <laneflow/laneflow.h>
///
/// auto diagram = laneflow::DiagramLoader::loadFile("flow.json");
///
/// laneflow::SwimlaneLayout layout;
/// laneflow::Graph graph = layout.layout(diagram);
///
/// laneflow::DrawioExport drawio(laneflow::StylePalette::preset("classic"));
/// drawio.exportToFile(graph, "flow.drawio");
/// @endcode

// Common - Logging
#include "common/Logger.h"

// Core module - Graph data structures
#include "core/Types.h"
#include "core/Axis.h"
#include "core/GeometryUtils.h"
#include "core/Errors.h"
#include "core/Shapes.h"
#include "core/Descriptors.h"
#include "core/Graph.h"

// Layout module - Layout passes
#include "layout/LayoutOptions.h"
#include "layout/NodeSizer.h"
#include "layout/GroupLayout.h"
#include "layout/CanvasLayout.h"
#include "layout/EdgeClassifier.h"
#include "layout/EdgeRouter.h"
#include "layout/SwimlaneLayout.h"
#include "layout/util/LayoutSerializer.h"

// IO module - Input documents
#include "io/DiagramLoader.h"

// Export module - Output formats
#include "export/IExporter.h"
#include "export/StylePalette.h"
#include "export/DrawioExport.h"
#include "export/SvgExport.h"

#include <string>

namespace laneflow {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace laneflow
