#include "laneflow/export/DrawioExport.h"
#include "laneflow/common/Logger.h"

#include <cmath>
#include <fstream>
#include <sstream>
#include <utility>

namespace laneflow {

namespace {

/// Relative (x, y) of an anchor side on the unit square of a shape
std::pair<const char*, const char*> anchorFraction(AnchorSide side) {
    switch (side) {
        case AnchorSide::Top: return {"0.5", "0"};
        case AnchorSide::Bottom: return {"0.5", "1"};
        case AnchorSide::Left: return {"0", "0.5"};
        case AnchorSide::Right: return {"1", "0.5"};
    }
    return {"0.5", "1"};
}

std::string num(float value) {
    return fmt::format("{}", value);
}

int pageExtent(float value) {
    return static_cast<int>(std::ceil(value));
}

void writeGeometry(std::ostream& out, const Rect& rect) {
    out << "  <mxGeometry x=\"" << num(rect.x) << "\" y=\"" << num(rect.y)
        << "\" width=\"" << num(rect.width) << "\" height=\"" << num(rect.height)
        << "\" as=\"geometry\" />\n";
}

}  // namespace

DrawioExport::DrawioExport(StylePalette palette, DrawioExportOptions options)
    : palette_(std::move(palette)), options_(std::move(options)) {}

std::string DrawioExport::exportToString(const Graph& graph) const {
    std::ostringstream out;
    exportToStream(graph, out);
    return out.str();
}

void DrawioExport::exportToStream(const Graph& graph, std::ostream& out) const {
    graph.requireStage(LayoutStage::Routed, "DrawioExport");

    const Size canvas = graph.canvasSize();
    const bool backdrop = palette_.hasCustomBackground();

    out << "<mxfile host=\"" << escapeXml(options_.host) << "\" agent=\"laneflow\" version=\"1.0.0\">\n";
    out << "  <diagram name=\"" << escapeXml(graph.title()) << "\" id=\"laneflow-diagram\">\n";
    out << "    <mxGraphModel dx=\"1306\" dy=\"898\" grid=\"1\" gridSize=\"" << options_.gridSize
        << "\" guides=\"1\" tooltips=\"1\" connect=\"1\" arrows=\"1\" fold=\"1\" page=\"1\" pageScale=\"1\""
        << " pageWidth=\"" << pageExtent(canvas.width) << "\" pageHeight=\"" << pageExtent(canvas.height)
        << "\" math=\"0\" shadow=\"" << (palette_.shadow() ? "1" : "0") << "\"";
    if (backdrop) {
        out << " background=\"" << escapeXml(palette_.background()) << "\"";
    }
    out << ">\n";
    out << "      <root>\n";

    // Mandatory root cells
    out << "<mxCell id=\"0\" />\n";
    out << "<mxCell id=\"1\" parent=\"0\" />\n";

    // draw.io ignores the page background when rendering, so paint it
    if (backdrop) {
        out << "<mxCell id=\"background\" value=\"\" style=\"rounded=0;whiteSpace=wrap;html=1;fillColor="
            << escapeXml(palette_.background()) << ";strokeColor=none;opacity=100;\" parent=\"1\" vertex=\"1\">\n";
        writeGeometry(out, Rect{Point{0.0f, 0.0f}, Size{static_cast<float>(pageExtent(canvas.width)),
                                                         static_cast<float>(pageExtent(canvas.height))}});
        out << "</mxCell>\n";
    }

    for (const auto& group : graph.groups()) {
        writeGroup(out, graph, group);
    }
    for (const auto& node : graph.nodes()) {
        writeNode(out, graph, node);
    }
    for (const auto& edge : graph.edges()) {
        writeEdge(out, graph, edge);
    }

    out << "      </root>\n";
    out << "    </mxGraphModel>\n";
    out << "  </diagram>\n";
    out << "</mxfile>\n";
}

bool DrawioExport::exportToFile(const Graph& graph, const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open '{}' for writing", filename);
        return false;
    }
    exportToStream(graph, file);
    return file.good();
}

std::string DrawioExport::groupCellId(GroupIndex index) {
    return "group-" + std::to_string(index);
}

std::string DrawioExport::nodeCellId(NodeIndex index) {
    return "node-" + std::to_string(index);
}

std::string DrawioExport::edgeCellId(EdgeIndex index) {
    return "edge-" + std::to_string(index);
}

std::string DrawioExport::nodeColorName(const Graph& graph, const NodeData& node) {
    if (node.color) return *node.color;
    if (node.isGrouped()) return graph.group(node.group).color;
    return "white";
}

std::string DrawioExport::nodeStyle(const Graph& graph, const NodeData& node) const {
    const ColorSpec& colors = palette_.color(nodeColorName(graph, node));
    const StyleDefaults& defaults = palette_.defaults();
    const ShapeAttributes& shape = node.shape;

    const std::string colorStyle = fmt::format("fillColor={};strokeColor={};fontColor={};",
                                               colors.fill, colors.stroke, colors.font);

    // BPMN stencils carry their own look; only colors come from the palette
    switch (shape.category) {
        case ShapeCategory::Task:
            return fmt::format("shape=mxgraph.bpmn.task;rectStyle=rounded;size=10;taskMarker={};"
                               "html=1;whiteSpace=wrap;{}",
                               toString(shape.marker.value_or(TaskMarker::Abstract)), colorStyle);
        case ShapeCategory::Event:
            return fmt::format("shape=mxgraph.bpmn.event;html=1;"
                               "verticalLabelPosition=bottom;verticalAlign=top;align=center;"
                               "perimeter=ellipsePerimeter;outlineConnect=0;aspect=fixed;"
                               "outline={};symbol={};{}",
                               toString(shape.outline.value_or(EventOutline::Standard)),
                               toString(shape.symbol.value_or(EventSymbol::General)), colorStyle);
        case ShapeCategory::Gateway:
            return fmt::format("shape=mxgraph.bpmn.gateway2;html=1;"
                               "verticalLabelPosition=bottom;verticalAlign=top;align=center;"
                               "perimeter=rhombusPerimeter;outlineConnect=0;"
                               "outline=none;symbol=none;gwType={};{}",
                               toString(shape.gatewayType.value_or(GatewayType::Exclusive)), colorStyle);
        default:
            break;
    }

    std::string base = fmt::format("whiteSpace=wrap;html=1;{}fontSize={};strokeWidth={};",
                                   colorStyle, defaults.nodeFontSize, defaults.nodeStrokeWidth);
    if (defaults.nodeFontStyle) base += fmt::format("fontStyle={};", defaults.nodeFontStyle);
    if (defaults.nodeShadow) base += "shadow=1;";

    switch (shape.category) {
        case ShapeCategory::Diamond: return "rhombus;" + base;
        case ShapeCategory::Ellipse: return "ellipse;" + base;
        case ShapeCategory::Cylinder: return "shape=cylinder3;boundedLbl=1;backgroundOutline=1;size=15;" + base;
        case ShapeCategory::Cloud: return "shape=cloud;" + base;
        case ShapeCategory::Document: return "shape=document;" + base;
        case ShapeCategory::Hexagon: return "shape=hexagon;perimeter=hexagonPerimeter2;size=0.25;" + base;
        case ShapeCategory::Actor: return "shape=umlActor;verticalLabelPosition=bottom;verticalAlign=top;" + base;
        case ShapeCategory::Callout: return "shape=callout;perimeter=calloutPerimeter;size=30;position=0.5;" + base;
        case ShapeCategory::Process: return "shape=process;size=0.1;" + base;
        case ShapeCategory::Parallelogram:
            return "shape=parallelogram;perimeter=parallelogramPerimeter;size=0.15;" + base;
        default: {
            std::string arc;
            if (defaults.arcSize && defaults.rounded) arc = fmt::format("arcSize={};", defaults.arcSize);
            return fmt::format("rounded={};{}{}", defaults.rounded ? 1 : 0, arc, base);
        }
    }
}

std::string DrawioExport::groupStyle(const Graph& graph, const GroupData& group) const {
    const ColorSpec& colors = palette_.color(group.color);
    const StyleDefaults& defaults = palette_.defaults();

    // Header band sits on the leading edge of the stacking axis
    const int horizontal = graph.direction() == Direction::TopDown ? 1 : 0;

    return fmt::format("swimlane;horizontal={};startSize={};"
                       "fillColor={};strokeColor={};fontColor={};strokeWidth={};"
                       "rounded=1;fontStyle=1;fontSize={};{}",
                       horizontal, num(graph.groupHeaderSize()),
                       colors.fill, colors.stroke, colors.font, defaults.nodeStrokeWidth,
                       defaults.groupFontSize, defaults.nodeShadow ? "shadow=1;" : "");
}

std::string DrawioExport::edgeStyle(const EdgeData& edge) const {
    const StyleDefaults& defaults = palette_.defaults();

    std::string style = fmt::format("edgeStyle=orthogonalEdgeStyle;rounded=1;orthogonalLoop=1;"
                                    "jettySize=auto;html=1;strokeWidth={};strokeColor={};",
                                    defaults.edgeWidth, defaults.edgeColor);
    if (!defaults.edgeLabelColor.empty()) style += "fontColor=" + defaults.edgeLabelColor + ";";
    if (!defaults.edgeLabelBackground.empty()) {
        style += "labelBackgroundColor=" + defaults.edgeLabelBackground + ";";
    }
    if (edge.style == LineStyle::Dashed) {
        style += "dashed=1;dashPattern=8 8;";
    }

    if (edge.route.pinned) {
        auto [exitX, exitY] = anchorFraction(edge.route.sourceSide);
        auto [entryX, entryY] = anchorFraction(edge.route.targetSide);
        style += fmt::format("exitX={};exitY={};exitDx=0;exitDy=0;"
                             "entryX={};entryY={};entryDx=0;entryDy=0;",
                             exitX, exitY, entryX, entryY);
    }
    return style;
}

void DrawioExport::writeGroup(std::ostream& out, const Graph& graph, const GroupData& group) const {
    out << "<mxCell id=\"" << groupCellId(group.index) << "\" value=\"" << escapeXml(group.label)
        << "\" style=\"" << escapeXml(groupStyle(graph, group)) << "\" parent=\"1\" vertex=\"1\">\n";
    writeGeometry(out, group.bounds());
    out << "</mxCell>\n";
}

void DrawioExport::writeNode(std::ostream& out, const Graph& graph, const NodeData& node) const {
    const std::string parent = node.isGrouped() ? groupCellId(node.group) : "1";
    // Children of a swimlane are positioned relative to it
    const Rect geometry = node.isGrouped() ? node.localBounds() : node.bounds();

    out << "<mxCell id=\"" << nodeCellId(node.index) << "\" value=\"" << escapeXml(node.label)
        << "\" style=\"" << escapeXml(nodeStyle(graph, node)) << "\" parent=\"" << parent
        << "\" vertex=\"1\">\n";
    writeGeometry(out, geometry);
    out << "</mxCell>\n";
}

void DrawioExport::writeEdge(std::ostream& out, const Graph& graph, const EdgeData& edge) const {
    const EdgeRoute& route = edge.route;
    const std::string parent = route.hasGroupContainer() ? groupCellId(route.container) : "1";

    out << "<mxCell id=\"" << edgeCellId(edge.index) << "\" ";
    if (!edge.label.empty()) {
        out << "value=\"" << escapeXml(edge.label) << "\" ";
    }
    out << "style=\"" << escapeXml(edgeStyle(edge)) << "\" parent=\"" << parent
        << "\" source=\"" << nodeCellId(edge.source) << "\" target=\"" << nodeCellId(edge.target)
        << "\" edge=\"1\">\n";

    if (route.waypoints.empty()) {
        out << "  <mxGeometry relative=\"1\" as=\"geometry\" />\n";
    } else {
        out << "  <mxGeometry relative=\"1\" as=\"geometry\">\n";
        out << "    <Array as=\"points\">\n";
        for (const auto& waypoint : route.waypoints) {
            const Point local = graph.toContainerLocal(waypoint, route.container);
            out << "      <mxPoint x=\"" << num(local.x) << "\" y=\"" << num(local.y) << "\" />\n";
        }
        out << "    </Array>\n";
        out << "  </mxGeometry>\n";
    }
    out << "</mxCell>\n";
}

}  // namespace laneflow
