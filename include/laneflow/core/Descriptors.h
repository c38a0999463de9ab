#pragma once

#include "Shapes.h"
#include "Types.h"

#include <optional>
#include <string>
#include <vector>

namespace laneflow {

/// Input contract handed over by the parsing/validation collaborator.
/// Order of every list is significant: it is the stacking and canvas order.

struct GroupDescriptor {
    std::string id;
    std::string label;
    std::string color = "blue";
};

struct NodeDescriptor {
    std::string id;
    std::string label;
    std::optional<std::string> group;
    std::optional<std::string> color;   ///< Inherits the group's color when empty
    ShapeSpec shape;
};

struct ConnectionDescriptor {
    std::string from;
    std::string to;
    std::string label;
    LineStyle style = LineStyle::Solid;
};

struct DiagramDescriptor {
    std::string title = "Diagram";
    std::string style;                  ///< Style preset name, empty = default
    Direction direction = Direction::TopDown;
    std::vector<GroupDescriptor> groups;
    std::vector<NodeDescriptor> nodes;
    std::vector<ConnectionDescriptor> connections;
};

}  // namespace laneflow
