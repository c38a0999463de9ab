#include <gtest/gtest.h>
#include <laneflow/core/Errors.h>
#include <laneflow/export/DrawioExport.h>
#include <laneflow/layout/SwimlaneLayout.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "TestDiagrams.h"

using namespace laneflow;
using laneflow::test::DiagramBuilder;

namespace {

size_t countOccurrences(const std::string& text, const std::string& pattern) {
    size_t count = 0;
    for (size_t pos = text.find(pattern); pos != std::string::npos; pos = text.find(pattern, pos + 1)) {
        ++count;
    }
    return count;
}

/// The mxCell element with the given id, up to its closing tag
std::string cell(const std::string& xml, const std::string& id) {
    const size_t start = xml.find("<mxCell id=\"" + id + "\"");
    if (start == std::string::npos) return {};
    const size_t end = xml.find("</mxCell>", start);
    return xml.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

Graph laidOut(const DiagramDescriptor& diagram) {
    return SwimlaneLayout().layout(diagram);
}

}  // namespace

TEST(DrawioExportTest, DocumentSkeleton) {
    Graph graph = laidOut(DiagramBuilder().group("g1").node("a", "g1").build());
    const std::string xml = DrawioExport().exportToString(graph);

    EXPECT_EQ(xml.rfind("<mxfile host=\"laneflow\"", 0), 0u);
    EXPECT_NE(xml.find("<diagram name=\"Test\" id=\"laneflow-diagram\">"), std::string::npos);
    EXPECT_NE(xml.find("pageWidth=\"1200\" pageHeight=\"800\""), std::string::npos);
    EXPECT_NE(xml.find("<mxCell id=\"0\" />"), std::string::npos);
    EXPECT_NE(xml.find("<mxCell id=\"1\" parent=\"0\" />"), std::string::npos);
    EXPECT_EQ(xml.find("id=\"background\""), std::string::npos);
    EXPECT_NE(xml.find("</mxfile>"), std::string::npos);
}

TEST(DrawioExportTest, GroupsAndMembersUseLocalGeometry) {
    Graph graph = laidOut(DiagramBuilder()
        .group("g1", "green").group("g2")
        .nodes("g1", {"a", "b"})
        .node("c", "g2")
        .node("x")
        .build());
    const std::string xml = DrawioExport().exportToString(graph);

    const std::string group = cell(xml, "group-0");
    EXPECT_NE(group.find("swimlane;horizontal=1;startSize=30;"), std::string::npos);
    EXPECT_NE(group.find("fillColor=#d5e8d4"), std::string::npos);
    EXPECT_NE(group.find("parent=\"1\""), std::string::npos);
    EXPECT_NE(group.find("x=\"40\" y=\"40\" width=\"280\" height=\"200\""), std::string::npos);

    const std::string member = cell(xml, "node-1");
    EXPECT_NE(member.find("parent=\"group-0\""), std::string::npos);
    EXPECT_NE(member.find("x=\"40\" y=\"110\" width=\"200\" height=\"40\""), std::string::npos);
    // Members inherit their lane's color
    EXPECT_NE(member.find("fillColor=#d5e8d4"), std::string::npos);

    const std::string loose = cell(xml, "node-3");
    EXPECT_NE(loose.find("parent=\"1\""), std::string::npos);
    EXPECT_NE(loose.find("x=\"720\" y=\"90\""), std::string::npos);
    EXPECT_NE(loose.find("fillColor=#ffffff"), std::string::npos);
}

TEST(DrawioExportTest, ForwardEdgeIsPinned) {
    Graph graph = laidOut(DiagramBuilder()
        .group("g1").group("g2")
        .node("a", "g1").node("c", "g2")
        .edge("a", "c", "next")
        .build());
    const std::string edge = cell(DrawioExport().exportToString(graph), "edge-0");

    EXPECT_NE(edge.find("value=\"next\""), std::string::npos);
    EXPECT_NE(edge.find("source=\"node-0\" target=\"node-1\" edge=\"1\""), std::string::npos);
    EXPECT_NE(edge.find("parent=\"1\""), std::string::npos);
    EXPECT_NE(edge.find("exitX=1;exitY=0.5;exitDx=0;exitDy=0;entryX=0;entryY=0.5;entryDx=0;entryDy=0;"),
              std::string::npos);
    EXPECT_NE(edge.find("<mxGeometry relative=\"1\" as=\"geometry\" />"), std::string::npos);
}

TEST(DrawioExportTest, IntraEdgeIsNotPinned) {
    Graph graph = laidOut(DiagramBuilder().group("g1").nodes("g1", {"a", "b"}).edge("a", "b").build());
    const std::string edge = cell(DrawioExport().exportToString(graph), "edge-0");

    EXPECT_EQ(edge.find("exitX"), std::string::npos);
    EXPECT_NE(edge.find("parent=\"group-0\""), std::string::npos);
}

TEST(DrawioExportTest, BackwardEdgeWaypoints) {
    Graph graph = laidOut(DiagramBuilder()
        .group("g1").group("g2")
        .nodes("g1", {"a", "b"})
        .nodes("g2", {"c", "d"})
        .edge("d", "a", "", LineStyle::Dashed)
        .build());
    const std::string edge = cell(DrawioExport().exportToString(graph), "edge-0");

    EXPECT_NE(edge.find("dashed=1;dashPattern=8 8;"), std::string::npos);
    EXPECT_NE(edge.find("exitX=0.5;exitY=1;"), std::string::npos);
    EXPECT_NE(edge.find("entryX=0.5;entryY=1;"), std::string::npos);
    EXPECT_NE(edge.find("<mxPoint x=\"520\" y=\"280\" />"), std::string::npos);
    EXPECT_NE(edge.find("<mxPoint x=\"180\" y=\"280\" />"), std::string::npos);
    EXPECT_EQ(edge.find("value="), std::string::npos);
}

TEST(DrawioExportTest, SkipEdgeWaypointsAreGroupLocal) {
    Graph graph = laidOut(DiagramBuilder().group("g1").nodes("g1", {"a", "b", "c"}).edge("a", "c").build());
    const std::string edge = cell(DrawioExport().exportToString(graph), "edge-0");

    EXPECT_NE(edge.find("parent=\"group-0\""), std::string::npos);
    EXPECT_NE(edge.find("<mxPoint x=\"260\" y=\"70\" />"), std::string::npos);
    EXPECT_NE(edge.find("<mxPoint x=\"260\" y=\"190\" />"), std::string::npos);
}

TEST(DrawioExportTest, LeftRightSwimlanesAreVertical) {
    Graph graph = laidOut(DiagramBuilder(Direction::LeftRight).group("g1").node("a", "g1").build());
    DrawioExport exporter;
    EXPECT_NE(exporter.groupStyle(graph, graph.group(0)).find("horizontal=0;"), std::string::npos);
}

TEST(DrawioExportTest, HeaderBandFollowsLayoutOptions) {
    LayoutOptions options;
    options.groupHeaderSize = 50.0f;
    Graph graph = SwimlaneLayout(options).layout(DiagramBuilder().group("g1").node("a", "g1").build());
    const std::string xml = DrawioExport().exportToString(graph);

    EXPECT_NE(cell(xml, "group-0").find("startSize=50;"), std::string::npos);
    // First member starts just past the wider band
    EXPECT_NE(cell(xml, "node-0").find("x=\"40\" y=\"70\""), std::string::npos);
}

TEST(DrawioExportTest, BpmnShapeStyles) {
    DiagramDescriptor diagram = DiagramBuilder().node("t").node("e").node("g").build();
    diagram.nodes[0].shape.shape = "task";
    diagram.nodes[0].shape.marker = "user";
    diagram.nodes[1].shape.shape = "event";
    diagram.nodes[1].shape.outline = "end";
    diagram.nodes[1].shape.symbol = "terminate";
    diagram.nodes[2].shape.shape = "gateway";
    diagram.nodes[2].shape.gatewayType = "parallel";
    Graph graph = laidOut(diagram);

    DrawioExport exporter;
    const std::string task = exporter.nodeStyle(graph, graph.node("t"));
    EXPECT_NE(task.find("shape=mxgraph.bpmn.task;"), std::string::npos);
    EXPECT_NE(task.find("taskMarker=user;"), std::string::npos);

    const std::string event = exporter.nodeStyle(graph, graph.node("e"));
    EXPECT_NE(event.find("shape=mxgraph.bpmn.event;"), std::string::npos);
    EXPECT_NE(event.find("outline=end;symbol=terminate;"), std::string::npos);
    EXPECT_NE(event.find("verticalLabelPosition=bottom;"), std::string::npos);

    const std::string gateway = exporter.nodeStyle(graph, graph.node("g"));
    EXPECT_NE(gateway.find("gwType=parallel;"), std::string::npos);
}

TEST(DrawioExportTest, PlainShapeStyles) {
    DiagramDescriptor diagram = DiagramBuilder().node("r").node("d", "", "diamond").node("c", "", "cylinder").build();
    Graph graph = laidOut(diagram);

    DrawioExport exporter;
    EXPECT_EQ(exporter.nodeStyle(graph, graph.node("r")).rfind("rounded=1;", 0), 0u);
    EXPECT_EQ(exporter.nodeStyle(graph, graph.node("d")).rfind("rhombus;", 0), 0u);
    EXPECT_EQ(exporter.nodeStyle(graph, graph.node("c")).rfind("shape=cylinder3;", 0), 0u);
}

TEST(DrawioExportTest, DarkPalettePaintsBackground) {
    Graph graph = laidOut(DiagramBuilder().group("g1").node("a", "g1").build());
    const std::string xml = DrawioExport(StylePalette::darkModern()).exportToString(graph);

    EXPECT_NE(xml.find("background=\"#0d1117\""), std::string::npos);
    EXPECT_NE(xml.find("shadow=\"1\""), std::string::npos);
    const std::string backdrop = cell(xml, "background");
    EXPECT_NE(backdrop.find("fillColor=#0d1117;"), std::string::npos);
    EXPECT_NE(backdrop.find("width=\"1200\" height=\"800\""), std::string::npos);
    // Painted before any content
    EXPECT_LT(xml.find("id=\"background\""), xml.find("id=\"group-0\""));
}

TEST(DrawioExportTest, EscapesLabels) {
    DiagramDescriptor diagram = DiagramBuilder().node("a").node("b").edge("a", "b", "x < y").build();
    diagram.nodes[0].label = "Pick & \"pack\"";
    Graph graph = laidOut(diagram);
    const std::string xml = DrawioExport().exportToString(graph);

    EXPECT_NE(xml.find("value=\"Pick &amp; &quot;pack&quot;\""), std::string::npos);
    EXPECT_NE(xml.find("value=\"x &lt; y\""), std::string::npos);
}

TEST(DrawioExportTest, CellIdsAreDeterministic) {
    auto diagram = DiagramBuilder().group("g1").nodes("g1", {"a", "b"}).edge("a", "b").build();
    EXPECT_EQ(DrawioExport().exportToString(laidOut(diagram)),
              DrawioExport().exportToString(laidOut(diagram)));

    const std::string xml = DrawioExport().exportToString(laidOut(diagram));
    EXPECT_EQ(countOccurrences(xml, "<mxCell id=\"node-"), 2u);
    EXPECT_EQ(countOccurrences(xml, "<mxCell id=\"edge-"), 1u);
    EXPECT_EQ(DrawioExport::groupCellId(3), "group-3");
}

TEST(DrawioExportTest, RequiresRoutedGraph) {
    Graph graph = Graph::fromDescriptor(DiagramBuilder().node("a").build());
    EXPECT_THROW(DrawioExport().exportToString(graph), LayoutInvariantViolation);
}

TEST(DrawioExportTest, ExportToFile) {
    Graph graph = laidOut(DiagramBuilder().node("a").build());
    DrawioExport exporter;
    EXPECT_EQ(exporter.fileExtension(), "drawio");
    EXPECT_EQ(exporter.mimeType(), "application/vnd.jgraph.mxfile");

    const auto path = std::filesystem::temp_directory_path() / "laneflow_export_test.drawio";
    ASSERT_TRUE(exporter.exportToFile(graph, path.string()));

    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    EXPECT_EQ(buffer.str(), exporter.exportToString(graph));
    std::filesystem::remove(path);

    EXPECT_FALSE(exporter.exportToFile(graph, "/nonexistent-dir/out.drawio"));
}
