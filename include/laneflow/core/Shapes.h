#pragma once

#include <optional>
#include <string>
#include <vector>

namespace laneflow {

/// Shape category of a node. Determines its fixed size and whether its
/// caption renders inside or below the body.
enum class ShapeCategory {
    Rectangle,
    Diamond,
    Ellipse,
    Cylinder,
    Cloud,
    Document,
    Hexagon,
    Actor,
    Callout,
    Process,
    Parallelogram,
    Task,       // BPMN task
    Event,      // BPMN event
    Gateway     // BPMN gateway
};

enum class TaskMarker { Abstract, Script, Send, Manual, Service, User };
enum class EventSymbol { General, Message, Timer, Error, Conditional, Terminate };
enum class EventOutline { Standard, BoundInt, End, Throwing };
enum class GatewayType { Exclusive, Parallel, Inclusive };

/// Shape category plus the attributes that only some categories accept.
/// Attributes are resolved to their defaults for the categories that take
/// them and left empty for all others.
struct ShapeAttributes {
    ShapeCategory category = ShapeCategory::Rectangle;
    std::optional<TaskMarker> marker;          ///< Task only
    std::optional<EventSymbol> symbol;         ///< Event only
    std::optional<EventOutline> outline;       ///< Event only
    std::optional<GatewayType> gatewayType;    ///< Gateway only

    bool operator==(const ShapeAttributes& o) const = default;
};

/// Raw, unvalidated shape attributes as they appear in input descriptors
struct ShapeSpec {
    std::string shape = "rectangle";
    std::optional<std::string> marker;
    std::optional<std::string> symbol;
    std::optional<std::string> outline;
    std::optional<std::string> gatewayType;
};

std::optional<ShapeCategory> parseShapeCategory(const std::string& name);
std::optional<TaskMarker> parseTaskMarker(const std::string& name);
std::optional<EventSymbol> parseEventSymbol(const std::string& name);
std::optional<EventOutline> parseEventOutline(const std::string& name);
std::optional<GatewayType> parseGatewayType(const std::string& name);

const char* toString(ShapeCategory category);
const char* toString(TaskMarker marker);
const char* toString(EventSymbol symbol);
const char* toString(EventOutline outline);
const char* toString(GatewayType type);

/// Names of every supported shape category, in declaration order
std::vector<std::string> shapeCategoryNames();

/// Resolve raw attributes for the node @p nodeId.
/// @throws InvalidShapeAttributeError on an unknown shape or attribute value,
///         or when an attribute is given to a shape that does not accept it
ShapeAttributes resolveShapeAttributes(const std::string& nodeId, const ShapeSpec& spec);

}  // namespace laneflow
