#include "laneflow/core/Shapes.h"
#include "laneflow/core/Errors.h"

#include <array>
#include <utility>

namespace laneflow {

namespace {

template <typename Enum, size_t N>
std::optional<Enum> lookup(const std::array<std::pair<const char*, Enum>, N>& table,
                           const std::string& name) {
    for (const auto& [text, value] : table) {
        if (name == text) return value;
    }
    return std::nullopt;
}

template <typename Enum, size_t N>
const char* reverseLookup(const std::array<std::pair<const char*, Enum>, N>& table, Enum value) {
    for (const auto& [text, v] : table) {
        if (v == value) return text;
    }
    return table.front().first;
}

constexpr std::array<std::pair<const char*, ShapeCategory>, 14> SHAPES = {{
    {"rectangle", ShapeCategory::Rectangle},
    {"diamond", ShapeCategory::Diamond},
    {"ellipse", ShapeCategory::Ellipse},
    {"cylinder", ShapeCategory::Cylinder},
    {"cloud", ShapeCategory::Cloud},
    {"document", ShapeCategory::Document},
    {"hexagon", ShapeCategory::Hexagon},
    {"actor", ShapeCategory::Actor},
    {"callout", ShapeCategory::Callout},
    {"process", ShapeCategory::Process},
    {"parallelogram", ShapeCategory::Parallelogram},
    {"task", ShapeCategory::Task},
    {"event", ShapeCategory::Event},
    {"gateway", ShapeCategory::Gateway},
}};

constexpr std::array<std::pair<const char*, TaskMarker>, 6> TASK_MARKERS = {{
    {"abstract", TaskMarker::Abstract},
    {"script", TaskMarker::Script},
    {"send", TaskMarker::Send},
    {"manual", TaskMarker::Manual},
    {"service", TaskMarker::Service},
    {"user", TaskMarker::User},
}};

constexpr std::array<std::pair<const char*, EventSymbol>, 6> EVENT_SYMBOLS = {{
    {"general", EventSymbol::General},
    {"message", EventSymbol::Message},
    {"timer", EventSymbol::Timer},
    {"error", EventSymbol::Error},
    {"conditional", EventSymbol::Conditional},
    {"terminate", EventSymbol::Terminate},
}};

constexpr std::array<std::pair<const char*, EventOutline>, 4> EVENT_OUTLINES = {{
    {"standard", EventOutline::Standard},
    {"boundInt", EventOutline::BoundInt},
    {"end", EventOutline::End},
    {"throwing", EventOutline::Throwing},
}};

constexpr std::array<std::pair<const char*, GatewayType>, 3> GATEWAY_TYPES = {{
    {"exclusive", GatewayType::Exclusive},
    {"parallel", GatewayType::Parallel},
    {"inclusive", GatewayType::Inclusive},
}};

void rejectForeignAttribute(const std::string& nodeId, const std::string& shape,
                            const char* attribute, const std::optional<std::string>& value) {
    if (value.has_value()) {
        throw InvalidShapeAttributeError(
            "Node '" + nodeId + "': attribute '" + attribute +
            "' is not valid for shape '" + shape + "'", nodeId);
    }
}

template <typename Enum, size_t N>
Enum resolveValue(const std::array<std::pair<const char*, Enum>, N>& table,
                  const std::string& nodeId, const char* attribute,
                  const std::optional<std::string>& value, Enum fallback) {
    if (!value.has_value()) return fallback;
    auto parsed = lookup(table, *value);
    if (!parsed) {
        throw InvalidShapeAttributeError(
            "Node '" + nodeId + "' has unknown " + attribute + ": '" + *value + "'", nodeId);
    }
    return *parsed;
}

}  // namespace

std::optional<ShapeCategory> parseShapeCategory(const std::string& name) { return lookup(SHAPES, name); }
std::optional<TaskMarker> parseTaskMarker(const std::string& name) { return lookup(TASK_MARKERS, name); }
std::optional<EventSymbol> parseEventSymbol(const std::string& name) { return lookup(EVENT_SYMBOLS, name); }
std::optional<EventOutline> parseEventOutline(const std::string& name) { return lookup(EVENT_OUTLINES, name); }
std::optional<GatewayType> parseGatewayType(const std::string& name) { return lookup(GATEWAY_TYPES, name); }

const char* toString(ShapeCategory category) { return reverseLookup(SHAPES, category); }
const char* toString(TaskMarker marker) { return reverseLookup(TASK_MARKERS, marker); }
const char* toString(EventSymbol symbol) { return reverseLookup(EVENT_SYMBOLS, symbol); }
const char* toString(EventOutline outline) { return reverseLookup(EVENT_OUTLINES, outline); }
const char* toString(GatewayType type) { return reverseLookup(GATEWAY_TYPES, type); }

std::vector<std::string> shapeCategoryNames() {
    std::vector<std::string> names;
    names.reserve(SHAPES.size());
    for (const auto& [text, value] : SHAPES) {
        names.emplace_back(text);
    }
    return names;
}

ShapeAttributes resolveShapeAttributes(const std::string& nodeId, const ShapeSpec& spec) {
    auto category = parseShapeCategory(spec.shape);
    if (!category) {
        throw InvalidShapeAttributeError(
            "Node '" + nodeId + "' has unknown shape: '" + spec.shape + "'", nodeId);
    }

    ShapeAttributes attrs;
    attrs.category = *category;

    switch (*category) {
        case ShapeCategory::Task:
            rejectForeignAttribute(nodeId, spec.shape, "symbol", spec.symbol);
            rejectForeignAttribute(nodeId, spec.shape, "outline", spec.outline);
            rejectForeignAttribute(nodeId, spec.shape, "gateway_type", spec.gatewayType);
            attrs.marker = resolveValue(TASK_MARKERS, nodeId, "task marker",
                                        spec.marker, TaskMarker::Abstract);
            break;
        case ShapeCategory::Event:
            rejectForeignAttribute(nodeId, spec.shape, "marker", spec.marker);
            rejectForeignAttribute(nodeId, spec.shape, "gateway_type", spec.gatewayType);
            attrs.symbol = resolveValue(EVENT_SYMBOLS, nodeId, "event symbol",
                                        spec.symbol, EventSymbol::General);
            attrs.outline = resolveValue(EVENT_OUTLINES, nodeId, "event outline",
                                         spec.outline, EventOutline::Standard);
            break;
        case ShapeCategory::Gateway:
            rejectForeignAttribute(nodeId, spec.shape, "marker", spec.marker);
            rejectForeignAttribute(nodeId, spec.shape, "symbol", spec.symbol);
            rejectForeignAttribute(nodeId, spec.shape, "outline", spec.outline);
            attrs.gatewayType = resolveValue(GATEWAY_TYPES, nodeId, "gateway type",
                                             spec.gatewayType, GatewayType::Exclusive);
            break;
        default:
            rejectForeignAttribute(nodeId, spec.shape, "marker", spec.marker);
            rejectForeignAttribute(nodeId, spec.shape, "symbol", spec.symbol);
            rejectForeignAttribute(nodeId, spec.shape, "outline", spec.outline);
            rejectForeignAttribute(nodeId, spec.shape, "gateway_type", spec.gatewayType);
            break;
    }

    return attrs;
}

}  // namespace laneflow
