#include "laneflow/io/DiagramLoader.h"
#include "laneflow/common/Logger.h"
#include "laneflow/core/Errors.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <unordered_set>

using json = nlohmann::json;

namespace laneflow {

namespace {

/// String value as written in the document, for error messages
std::string textOf(const json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

/// Optional string field; the fallback applies only when the key is absent
std::string stringOr(const json& object, const char* key, const std::string& fallback) {
    auto it = object.find(key);
    return it == object.end() ? fallback : textOf(*it);
}

std::optional<std::string> optionalString(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) return std::nullopt;
    return it->get<std::string>();
}

/// Id used in node messages: the id when present, else the array position
std::string nodeLabelForErrors(const json& node, size_t index) {
    auto it = node.find("id");
    return it == node.end() ? std::to_string(index) : textOf(*it);
}

void validateShape(const json& node, const std::string& nid, std::vector<std::string>& errors) {
    const std::string shape = stringOr(node, "shape", "rectangle");
    const auto category = parseShapeCategory(shape);
    if (!category) {
        errors.push_back(fmt::format("Node '{}' has unknown shape: '{}'", nid, shape));
        return;
    }

    if (*category == ShapeCategory::Task) {
        const std::string marker = stringOr(node, "marker", "abstract");
        if (!parseTaskMarker(marker)) {
            errors.push_back(fmt::format("Node '{}' has unknown task marker: '{}'", nid, marker));
        }
    } else if (*category == ShapeCategory::Event) {
        const std::string symbol = stringOr(node, "symbol", "general");
        if (!parseEventSymbol(symbol)) {
            errors.push_back(fmt::format("Node '{}' has unknown event symbol: '{}'", nid, symbol));
        }
        const std::string outline = stringOr(node, "outline", "standard");
        if (!parseEventOutline(outline)) {
            errors.push_back(fmt::format("Node '{}' has unknown event outline: '{}'", nid, outline));
        }
    } else if (*category == ShapeCategory::Gateway) {
        const std::string type = stringOr(node, "gateway_type", "exclusive");
        if (!parseGatewayType(type)) {
            errors.push_back(fmt::format("Node '{}' has unknown gateway type: '{}'", nid, type));
        }
    }
}

LineStyle parseLineStyle(const std::string& value) {
    if (value == "dashed") return LineStyle::Dashed;
    return LineStyle::Solid;
}

}  // namespace

std::vector<std::string> DiagramLoader::validate(const json& document) {
    std::vector<std::string> errors;

    if (!document.is_object()) {
        return {"Input must be a JSON object"};
    }

    if (!document.contains("nodes") && !document.contains("groups")) {
        errors.emplace_back("Input must have 'nodes' or 'groups'");
    }

    if (auto it = document.find("direction"); it != document.end()) {
        const std::string direction = textOf(*it);
        if (direction != "TD" && direction != "LR") {
            errors.push_back(fmt::format("Unknown direction: '{}' (expected 'TD' or 'LR')", direction));
        }
    }

    // Nodes
    const json empty = json::array();
    const json& nodes = document.contains("nodes") ? document["nodes"] : empty;
    std::unordered_set<std::string> nodeIds;
    if (!nodes.is_array()) {
        errors.emplace_back("'nodes' must be an array");
    } else {
        for (size_t i = 0; i < nodes.size(); ++i) {
            const json& node = nodes[i];
            if (!node.is_object()) {
                errors.push_back(fmt::format("Node {} must be an object", i));
                continue;
            }
            if (!node.contains("id")) {
                errors.push_back(fmt::format("Node {} missing 'id'", i));
            } else if (!node["id"].is_string()) {
                errors.push_back(fmt::format("Node {} 'id' must be a string", i));
            } else {
                const std::string id = node["id"].get<std::string>();
                if (!nodeIds.insert(id).second) {
                    errors.push_back(fmt::format("Duplicate node id: {}", id));
                }
            }
            validateShape(node, nodeLabelForErrors(node, i), errors);
        }
    }

    // Groups
    const json& groups = document.contains("groups") ? document["groups"] : empty;
    std::unordered_set<std::string> groupIds;
    if (!groups.is_array()) {
        errors.emplace_back("'groups' must be an array");
    } else {
        for (size_t i = 0; i < groups.size(); ++i) {
            const json& group = groups[i];
            if (!group.is_object()) {
                errors.push_back(fmt::format("Group {} must be an object", i));
                continue;
            }
            if (!group.contains("id")) {
                errors.push_back(fmt::format("Group {} missing 'id'", i));
            } else if (!group["id"].is_string()) {
                errors.push_back(fmt::format("Group {} 'id' must be a string", i));
            } else {
                const std::string id = group["id"].get<std::string>();
                if (!groupIds.insert(id).second) {
                    errors.push_back(fmt::format("Duplicate group id: {}", id));
                }
            }
        }
    }

    if (nodes.is_array()) {
        for (size_t i = 0; i < nodes.size(); ++i) {
            const json& node = nodes[i];
            if (!node.is_object() || !node.contains("group") || node["group"].is_null()) continue;
            const std::string group = textOf(node["group"]);
            if (!groupIds.count(group)) {
                errors.push_back(fmt::format("Node '{}' references unknown group: '{}'",
                                             nodeLabelForErrors(node, i), group));
            }
        }
    }

    // Connections
    const json& connections = document.contains("connections") ? document["connections"] : empty;
    if (!connections.is_array()) {
        errors.emplace_back("'connections' must be an array");
    } else {
        for (size_t i = 0; i < connections.size(); ++i) {
            const json& conn = connections[i];
            if (!conn.is_object()) {
                errors.push_back(fmt::format("Connection {} must be an object", i));
                continue;
            }
            for (const char* key : {"from", "to"}) {
                if (!conn.contains(key)) {
                    errors.push_back(fmt::format("Connection {} missing '{}'", i, key));
                } else if (!nodeIds.count(textOf(conn[key]))) {
                    errors.push_back(fmt::format("Connection {} '{}' references unknown id: {}",
                                                 i, key, textOf(conn[key])));
                }
            }
            const std::string style = stringOr(conn, "style", "solid");
            if (style != "solid" && style != "dashed") {
                errors.push_back(fmt::format("Connection {} has unknown style: '{}'", i, style));
            }
        }
    }

    return errors;
}

DiagramDescriptor DiagramLoader::fromJson(const json& document) {
    const auto errors = validate(document);
    if (!errors.empty()) {
        std::ostringstream message;
        message << "Invalid diagram (" << errors.size() << " errors):";
        for (const auto& error : errors) {
            message << "\n  - " << error;
        }
        throw DiagramParseError(message.str());
    }

    DiagramDescriptor diagram;
    try {
        diagram.title = document.value("title", std::string("Diagram"));
        diagram.style = document.value("style", std::string());
        diagram.direction = parseDirection(document.value("direction", std::string("TD")));

        for (const auto& g : document.value("groups", json::array())) {
            GroupDescriptor group;
            group.id = g.at("id").get<std::string>();
            group.label = g.value("label", group.id);
            group.color = g.value("color", std::string("blue"));
            diagram.groups.push_back(std::move(group));
        }

        for (const auto& n : document.value("nodes", json::array())) {
            NodeDescriptor node;
            node.id = n.at("id").get<std::string>();
            node.label = n.value("label", node.id);
            node.group = optionalString(n, "group");
            node.color = optionalString(n, "color");
            node.shape.shape = n.value("shape", std::string("rectangle"));
            node.shape.marker = optionalString(n, "marker");
            node.shape.symbol = optionalString(n, "symbol");
            node.shape.outline = optionalString(n, "outline");
            node.shape.gatewayType = optionalString(n, "gateway_type");
            diagram.nodes.push_back(std::move(node));
        }

        for (const auto& c : document.value("connections", json::array())) {
            ConnectionDescriptor connection;
            connection.from = c.at("from").get<std::string>();
            connection.to = c.at("to").get<std::string>();
            connection.label = c.value("label", std::string());
            connection.style = parseLineStyle(c.value("style", std::string("solid")));
            diagram.connections.push_back(std::move(connection));
        }
    } catch (const json::exception& e) {
        throw DiagramParseError(std::string("Invalid diagram field: ") + e.what());
    }

    LOG_DEBUG("Loaded diagram '{}': {} groups, {} nodes, {} connections",
              diagram.title, diagram.groups.size(), diagram.nodes.size(), diagram.connections.size());
    return diagram;
}

DiagramDescriptor DiagramLoader::parse(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw DiagramParseError(std::string("Malformed JSON: ") + e.what());
    }
    return fromJson(document);
}

DiagramDescriptor DiagramLoader::parse(std::istream& in) {
    json document;
    try {
        document = json::parse(in);
    } catch (const json::parse_error& e) {
        throw DiagramParseError(std::string("Malformed JSON: ") + e.what());
    }
    return fromJson(document);
}

DiagramDescriptor DiagramLoader::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw DiagramParseError("Cannot open diagram file: " + path);
    }
    return parse(file);
}

Direction DiagramLoader::parseDirection(const std::string& value) {
    if (value == "TD") return Direction::TopDown;
    if (value == "LR") return Direction::LeftRight;
    throw DiagramParseError("Unknown direction: '" + value + "' (expected 'TD' or 'LR')");
}

}  // namespace laneflow
