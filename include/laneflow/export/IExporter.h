#pragma once

#include <ostream>
#include <string>

namespace laneflow {

class Graph;

/// Abstract interface for diagram exporters
///
/// Exporters read a routed Graph and never modify it. Styling is fixed at
/// construction, so one exporter instance can serve many graphs.
class IExporter {
public:
    virtual ~IExporter() = default;

    /// Export a routed graph to string
    /// @throws LayoutInvariantViolation if the graph has not been routed
    virtual std::string exportToString(const Graph& graph) const = 0;

    /// Export to an output stream
    virtual void exportToStream(const Graph& graph, std::ostream& out) const = 0;

    /// Export to a file
    /// @return false if the file could not be written
    virtual bool exportToFile(const Graph& graph, const std::string& filename) const = 0;

    /// File extension for this export format (e.g., "drawio", "svg")
    virtual std::string fileExtension() const = 0;

    /// MIME type for this export format (e.g., "image/svg+xml")
    virtual std::string mimeType() const = 0;
};

/// Escape the markup metacharacters & < > " ' for text and attribute values
std::string escapeXml(const std::string& text);

}  // namespace laneflow
