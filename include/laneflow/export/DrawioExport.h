#pragma once

#include "../core/Graph.h"
#include "IExporter.h"
#include "StylePalette.h"

#include <ostream>
#include <string>

namespace laneflow {

/// Options for draw.io export
struct DrawioExportOptions {
    int gridSize = 10;
    std::string host = "laneflow";
};

/// Exports routed graphs as draw.io (mxfile) documents.
///
/// Cell ids are derived from entity indices, so the same graph always
/// produces the same document. Group members are children of their
/// swimlane cell with group-relative geometry; edges are children of
/// their route container with waypoints in that container's frame.
class DrawioExport : public IExporter {
public:
    DrawioExport() = default;
    explicit DrawioExport(StylePalette palette, DrawioExportOptions options = {});
    ~DrawioExport() override = default;

    std::string exportToString(const Graph& graph) const override;
    void exportToStream(const Graph& graph, std::ostream& out) const override;
    bool exportToFile(const Graph& graph, const std::string& filename) const override;

    std::string fileExtension() const override { return "drawio"; }
    std::string mimeType() const override { return "application/vnd.jgraph.mxfile"; }

    const StylePalette& palette() const { return palette_; }
    const DrawioExportOptions& options() const { return options_; }

    // Style strings, exposed for inspection
    std::string nodeStyle(const Graph& graph, const NodeData& node) const;
    std::string groupStyle(const Graph& graph, const GroupData& group) const;
    std::string edgeStyle(const EdgeData& edge) const;

    static std::string groupCellId(GroupIndex index);
    static std::string nodeCellId(NodeIndex index);
    static std::string edgeCellId(EdgeIndex index);

private:
    StylePalette palette_;
    DrawioExportOptions options_;

    /// Node color name: its own, else its group's, else "white"
    static std::string nodeColorName(const Graph& graph, const NodeData& node);

    void writeGroup(std::ostream& out, const Graph& graph, const GroupData& group) const;
    void writeNode(std::ostream& out, const Graph& graph, const NodeData& node) const;
    void writeEdge(std::ostream& out, const Graph& graph, const EdgeData& edge) const;
};

}  // namespace laneflow
