#pragma once

#include "../core/Descriptors.h"

#include <nlohmann/json_fwd.hpp>

#include <istream>
#include <string>
#include <vector>

namespace laneflow {

/// Reads diagram documents into descriptors.
///
/// Document shape:
/// @code{.json}
/// {
///   "title": "Order flow", "style": "classic", "type": "swimlane",
///   "direction": "TD",
///   "groups": [{"id": "g1", "label": "Sales", "color": "blue"}],
///   "nodes": [{"id": "n1", "label": "Start", "group": "g1", "shape": "event",
///              "symbol": "message", "outline": "standard"}],
///   "connections": [{"from": "n1", "to": "n2", "label": "yes", "style": "dashed"}]
/// }
/// @endcode
class DiagramLoader {
public:
    /// Collect every schema problem of a document, in document order.
    /// Never throws; an empty result means the document can be loaded.
    static std::vector<std::string> validate(const nlohmann::json& document);

    /// Convert a document into descriptors.
    /// @throws DiagramParseError if validate() reports errors or a field has the wrong type
    static DiagramDescriptor fromJson(const nlohmann::json& document);

    /// Parse JSON text.
    /// @throws DiagramParseError on malformed JSON or schema errors
    static DiagramDescriptor parse(const std::string& text);
    static DiagramDescriptor parse(std::istream& in);

    /// @throws DiagramParseError if the file cannot be read or parsed
    static DiagramDescriptor loadFile(const std::string& path);

    /// "TD" or "LR"
    /// @throws DiagramParseError for any other value
    static Direction parseDirection(const std::string& value);
};

}  // namespace laneflow
