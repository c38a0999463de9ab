#pragma once

#include "../core/Graph.h"
#include "IExporter.h"
#include "StylePalette.h"

#include <ostream>
#include <string>
#include <vector>

namespace laneflow {

/// Options for SVG export
struct SvgExportOptions {
    float nodeCornerRadius = 5.0f;
    float groupCornerRadius = 8.0f;
    std::string fontFamily = "Helvetica, Arial, sans-serif";
    float bottomLabelOffset = 14.0f; ///< Baseline distance of a caption below its shape

    bool showNodeLabels = true;
    bool showEdgeLabels = true;
};

/// Exports routed graphs as a static SVG preview.
///
/// Connectors are drawn as polylines through their anchors and waypoints.
/// Unpinned intra-group connectors, which the draw.io router would lay out
/// itself, are drawn straight between their anchors.
class SvgExport : public IExporter {
public:
    SvgExport() = default;
    explicit SvgExport(StylePalette palette, SvgExportOptions options = {});
    ~SvgExport() override = default;

    std::string exportToString(const Graph& graph) const override;
    void exportToStream(const Graph& graph, std::ostream& out) const override;
    bool exportToFile(const Graph& graph, const std::string& filename) const override;

    std::string fileExtension() const override { return "svg"; }
    std::string mimeType() const override { return "image/svg+xml"; }

    const StylePalette& palette() const { return palette_; }
    const SvgExportOptions& options() const { return options_; }

private:
    StylePalette palette_;
    SvgExportOptions options_;

    void writeHeader(std::ostream& out, const Size& canvas) const;
    void writeMarkers(std::ostream& out) const;
    void writeFooter(std::ostream& out) const;

    void writeGroup(std::ostream& out, const Graph& graph, const GroupData& group) const;
    void writeNode(std::ostream& out, const Graph& graph, const NodeData& node) const;
    void writeEdge(std::ostream& out, const Graph& graph, const EdgeData& edge) const;
};

}  // namespace laneflow
