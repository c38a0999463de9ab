#include "laneflow/export/SvgExport.h"
#include "laneflow/common/Logger.h"
#include "laneflow/layout/EdgeRouter.h"

#include <fstream>
#include <sstream>
#include <utility>

namespace laneflow {

namespace {

std::string num(float value) {
    return fmt::format("{}", value);
}

/// Midpoint of the longest segment, where a connector label reads best
Point labelAnchor(const std::vector<Point>& points) {
    Point best = points.front();
    float longest = -1.0f;
    for (size_t i = 1; i < points.size(); ++i) {
        const float length = points[i - 1].distanceTo(points[i]);
        if (length > longest) {
            longest = length;
            best = {(points[i - 1].x + points[i].x) / 2.0f, (points[i - 1].y + points[i].y) / 2.0f};
        }
    }
    return best;
}

}  // namespace

SvgExport::SvgExport(StylePalette palette, SvgExportOptions options)
    : palette_(std::move(palette)), options_(std::move(options)) {}

std::string SvgExport::exportToString(const Graph& graph) const {
    std::ostringstream out;
    exportToStream(graph, out);
    return out.str();
}

void SvgExport::exportToStream(const Graph& graph, std::ostream& out) const {
    graph.requireStage(LayoutStage::Routed, "SvgExport");

    writeHeader(out, graph.canvasSize());
    writeMarkers(out);

    // Lanes first, then connectors, then nodes on top
    for (const auto& group : graph.groups()) {
        writeGroup(out, graph, group);
    }
    for (const auto& edge : graph.edges()) {
        writeEdge(out, graph, edge);
    }
    for (const auto& node : graph.nodes()) {
        writeNode(out, graph, node);
    }

    writeFooter(out);
}

bool SvgExport::exportToFile(const Graph& graph, const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open '{}' for writing", filename);
        return false;
    }
    exportToStream(graph, file);
    return file.good();
}

void SvgExport::writeHeader(std::ostream& out, const Size& canvas) const {
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << "<svg xmlns=\"http://www.w3.org/2000/svg\" "
        << "width=\"" << num(canvas.width) << "\" "
        << "height=\"" << num(canvas.height) << "\" "
        << "viewBox=\"0 0 " << num(canvas.width) << " " << num(canvas.height) << "\">\n";

    out << "  <rect x=\"0\" y=\"0\" width=\"" << num(canvas.width) << "\" height=\"" << num(canvas.height)
        << "\" fill=\"" << escapeXml(palette_.background()) << "\"/>\n";
}

void SvgExport::writeMarkers(std::ostream& out) const {
    out << "  <defs>\n";
    out << "    <marker id=\"arrowhead\" markerWidth=\"10\" markerHeight=\"7\" "
        << "refX=\"9\" refY=\"3.5\" orient=\"auto\">\n";
    out << "      <polygon points=\"0 0, 10 3.5, 0 7\" fill=\""
        << escapeXml(palette_.defaults().edgeColor) << "\"/>\n";
    out << "    </marker>\n";
    out << "  </defs>\n";
}

void SvgExport::writeFooter(std::ostream& out) const {
    out << "</svg>\n";
}

void SvgExport::writeGroup(std::ostream& out, const Graph& graph, const GroupData& group) const {
    const ColorSpec& colors = palette_.color(group.color);
    const Rect bounds = group.bounds();
    const bool vertical = graph.direction() == Direction::TopDown;

    out << "  <g class=\"group\" id=\"" << escapeXml(group.id) << "\">\n";
    out << "    <rect x=\"" << num(bounds.x) << "\" y=\"" << num(bounds.y)
        << "\" width=\"" << num(bounds.width) << "\" height=\"" << num(bounds.height)
        << "\" rx=\"" << num(options_.groupCornerRadius) << "\" fill=\"" << escapeXml(colors.fill)
        << "\" stroke=\"" << escapeXml(colors.stroke) << "\"/>\n";

    // Header band: across the top of a vertical lane, down the left of a horizontal one
    const Rect header = vertical
        ? Rect{bounds.x, bounds.y, bounds.width, graph.groupHeaderSize()}
        : Rect{bounds.x, bounds.y, graph.groupHeaderSize(), bounds.height};
    out << "    <rect x=\"" << num(header.x) << "\" y=\"" << num(header.y)
        << "\" width=\"" << num(header.width) << "\" height=\"" << num(header.height)
        << "\" fill=\"" << escapeXml(colors.stroke) << "\" fill-opacity=\"0.25\"/>\n";

    const Point title = header.center();
    out << "    <text x=\"" << num(title.x) << "\" y=\"" << num(title.y)
        << "\" font-family=\"" << escapeXml(options_.fontFamily)
        << "\" font-size=\"" << palette_.defaults().groupFontSize
        << "\" font-weight=\"bold\" fill=\"" << escapeXml(colors.font)
        << "\" text-anchor=\"middle\" dominant-baseline=\"central\"";
    if (!vertical) {
        out << " transform=\"rotate(-90 " << num(title.x) << " " << num(title.y) << ")\"";
    }
    out << ">" << escapeXml(group.label) << "</text>\n";
    out << "  </g>\n";
}

void SvgExport::writeNode(std::ostream& out, const Graph& graph, const NodeData& node) const {
    std::string colorName = "white";
    if (node.color) {
        colorName = *node.color;
    } else if (node.isGrouped()) {
        colorName = graph.group(node.group).color;
    }
    const ColorSpec& colors = palette_.color(colorName);
    const Rect bounds = node.bounds();
    const Point center = bounds.center();

    const std::string paint = "fill=\"" + escapeXml(colors.fill) + "\" stroke=\"" +
                              escapeXml(colors.stroke) + "\" stroke-width=\"" +
                              std::to_string(palette_.defaults().nodeStrokeWidth) + "\"";

    out << "  <g class=\"node " << toString(node.shape.category) << "\" id=\"" << escapeXml(node.id) << "\">\n";
    switch (node.shape.category) {
        case ShapeCategory::Ellipse:
        case ShapeCategory::Event:
            out << "    <ellipse cx=\"" << num(center.x) << "\" cy=\"" << num(center.y)
                << "\" rx=\"" << num(bounds.width / 2.0f) << "\" ry=\"" << num(bounds.height / 2.0f)
                << "\" " << paint << "/>\n";
            break;
        case ShapeCategory::Diamond:
        case ShapeCategory::Gateway:
            out << "    <polygon points=\""
                << num(center.x) << "," << num(bounds.top()) << " "
                << num(bounds.right()) << "," << num(center.y) << " "
                << num(center.x) << "," << num(bounds.bottom()) << " "
                << num(bounds.left()) << "," << num(center.y) << "\" " << paint << "/>\n";
            break;
        default:
            out << "    <rect x=\"" << num(bounds.x) << "\" y=\"" << num(bounds.y)
                << "\" width=\"" << num(bounds.width) << "\" height=\"" << num(bounds.height)
                << "\" rx=\"" << num(options_.nodeCornerRadius) << "\" " << paint << "/>\n";
            break;
    }

    if (options_.showNodeLabels) {
        const float labelY = node.bottomLabel ? bounds.bottom() + options_.bottomLabelOffset : center.y;
        out << "    <text x=\"" << num(center.x) << "\" y=\"" << num(labelY)
            << "\" font-family=\"" << escapeXml(options_.fontFamily)
            << "\" font-size=\"" << palette_.defaults().nodeFontSize
            << "\" fill=\"" << escapeXml(colors.font)
            << "\" text-anchor=\"middle\" dominant-baseline=\"central\">"
            << escapeXml(node.label) << "</text>\n";
    }
    out << "  </g>\n";
}

void SvgExport::writeEdge(std::ostream& out, const Graph& graph, const EdgeData& edge) const {
    const std::vector<Point> points = EdgeRouter::routePolyline(graph, edge);
    const StyleDefaults& defaults = palette_.defaults();

    out << "  <path class=\"edge " << toString(edge.route.routeCase) << "\" d=\"";
    out << "M " << num(points[0].x) << " " << num(points[0].y);
    for (size_t i = 1; i < points.size(); ++i) {
        out << " L " << num(points[i].x) << " " << num(points[i].y);
    }
    out << "\" fill=\"none\" stroke=\"" << escapeXml(defaults.edgeColor)
        << "\" stroke-width=\"" << defaults.edgeWidth << "\"";
    if (edge.style == LineStyle::Dashed) {
        out << " stroke-dasharray=\"8 8\"";
    }
    out << " marker-end=\"url(#arrowhead)\"/>\n";

    if (options_.showEdgeLabels && !edge.label.empty()) {
        const Point at = labelAnchor(points);
        const std::string labelColor = defaults.edgeLabelColor.empty() ? "#333333" : defaults.edgeLabelColor;
        out << "  <text x=\"" << num(at.x) << "\" y=\"" << num(at.y - 5.0f)
            << "\" font-family=\"" << escapeXml(options_.fontFamily)
            << "\" font-size=\"" << defaults.nodeFontSize
            << "\" fill=\"" << escapeXml(labelColor)
            << "\" text-anchor=\"middle\">" << escapeXml(edge.label) << "</text>\n";
    }
}

}  // namespace laneflow
