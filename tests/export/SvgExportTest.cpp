#include <gtest/gtest.h>
#include <laneflow/core/Errors.h>
#include <laneflow/export/SvgExport.h>
#include <laneflow/layout/SwimlaneLayout.h>

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

}  // namespace

// ============================================================================
// SvgExportTest - static SVG preview of a laid out diagram
// ============================================================================

TEST(SvgExportTest, SwimlaneDiagram_ProducesValidSvg) {
    Graph graph = SwimlaneLayout().layout(DiagramBuilder()
        .group("g1").group("g2")
        .nodes("g1", {"a", "b"})
        .node("c", "g2")
        .edge("a", "b").edge("b", "c")
        .build());

    SvgExport svg;
    std::string output = svg.exportToString(graph);

    EXPECT_EQ(output.rfind("<?xml", 0), 0u);
    EXPECT_NE(output.find("<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"1200\" height=\"800\""),
              std::string::npos);
    EXPECT_NE(output.find("</svg>"), std::string::npos);

    // Background + 2 x (lane + header band) + 3 nodes
    EXPECT_EQ(countOccurrences(output, "<rect"), 8u);
    EXPECT_EQ(countOccurrences(output, "<path class=\"edge"), 2u);
    EXPECT_NE(output.find("<path class=\"edge intra\""), std::string::npos);
    EXPECT_NE(output.find("<path class=\"edge forward\""), std::string::npos);
}

TEST(SvgExportTest, EdgePathFollowsRoute) {
    Graph graph = SwimlaneLayout().layout(DiagramBuilder()
        .group("g1").group("g2")
        .nodes("g1", {"a", "b"})
        .nodes("g2", {"c", "d"})
        .edge("d", "a", "", LineStyle::Dashed)
        .build());

    std::string output = SvgExport().exportToString(graph);
    EXPECT_NE(output.find("d=\"M 520 190 L 520 280 L 180 280 L 180 130\""), std::string::npos);
    EXPECT_NE(output.find("stroke-dasharray=\"8 8\""), std::string::npos);
}

TEST(SvgExportTest, ShapesRenderByCategory) {
    Graph graph = SwimlaneLayout().layout(DiagramBuilder()
        .node("e", "", "event").node("g", "", "gateway").node("t", "", "task")
        .build());

    std::string output = SvgExport().exportToString(graph);
    EXPECT_EQ(countOccurrences(output, "<ellipse"), 1u);
    EXPECT_NE(output.find("<g class=\"node gateway\" id=\"g\">\n    <polygon"), std::string::npos);
    EXPECT_NE(output.find("<g class=\"node task\" id=\"t\">\n    <rect"), std::string::npos);
}

TEST(SvgExportTest, BottomLabelsSitBelowShape) {
    Graph graph = SwimlaneLayout().layout(DiagramBuilder().node("e", "", "event").build());
    std::string output = SvgExport().exportToString(graph);

    // Event at (175, 40), 50 high: caption baseline 14 below it
    EXPECT_NE(output.find("<text x=\"200\" y=\"104\""), std::string::npos);
}

TEST(SvgExportTest, LabelsCanBeHidden) {
    Graph graph = SwimlaneLayout().layout(DiagramBuilder().node("a").node("b").edge("a", "b", "go").build());

    SvgExportOptions options;
    options.showNodeLabels = false;
    options.showEdgeLabels = false;
    std::string output = SvgExport(StylePalette::classic(), options).exportToString(graph);
    EXPECT_EQ(output.find("<text"), std::string::npos);

    std::string labelled = SvgExport().exportToString(graph);
    EXPECT_NE(labelled.find(">go</text>"), std::string::npos);
}

TEST(SvgExportTest, PaletteDrivesColors) {
    Graph graph = SwimlaneLayout().layout(DiagramBuilder().group("g1", "red").node("a", "g1").build());
    std::string output = SvgExport(StylePalette::darkModern()).exportToString(graph);

    EXPECT_NE(output.find("fill=\"#0d1117\""), std::string::npos);
    EXPECT_NE(output.find("fill=\"#3d1d20\""), std::string::npos);
}

TEST(SvgExportTest, EscapesText) {
    DiagramDescriptor diagram = DiagramBuilder().node("a").build();
    diagram.nodes[0].label = "<b>";
    Graph graph = SwimlaneLayout().layout(diagram);

    std::string output = SvgExport().exportToString(graph);
    EXPECT_NE(output.find("&lt;b&gt;"), std::string::npos);
    EXPECT_EQ(output.find("<b>"), std::string::npos);
}

TEST(SvgExportTest, HeaderBandFollowsLayoutOptions) {
    LayoutOptions options;
    options.groupHeaderSize = 50.0f;
    Graph graph = SwimlaneLayout(options).layout(DiagramBuilder().group("g1").node("a", "g1").build());

    std::string output = SvgExport().exportToString(graph);
    EXPECT_NE(output.find("<rect x=\"40\" y=\"40\" width=\"280\" height=\"50\" fill="), std::string::npos);
}

TEST(SvgExportTest, RequiresRoutedGraph) {
    Graph graph = Graph::fromDescriptor(DiagramBuilder().node("a").build());
    EXPECT_THROW(SvgExport().exportToString(graph), LayoutInvariantViolation);
}

TEST(SvgExportTest, FileExtension) {
    SvgExport svg;
    EXPECT_EQ(svg.fileExtension(), "svg");
    EXPECT_EQ(svg.mimeType(), "image/svg+xml");
}
