#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>

namespace laneflow {

using NodeIndex = uint32_t;
using GroupIndex = uint32_t;
using EdgeIndex = uint32_t;

constexpr NodeIndex INVALID_NODE = UINT32_MAX;
constexpr GroupIndex INVALID_GROUP = UINT32_MAX;
constexpr EdgeIndex INVALID_EDGE = UINT32_MAX;

struct Point {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Point() = default;
    constexpr Point(float x_, float y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    constexpr Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }

    float length() const { return std::sqrt(x * x + y * y); }
    float distanceTo(const Point& o) const { return (*this - o).length(); }

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

struct Size {
    float width = 0.0f;
    float height = 0.0f;

    constexpr Size() = default;
    constexpr Size(float w, float h) : width(w), height(h) {}

    constexpr bool operator==(const Size& o) const {
        return width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Size& o) const { return !(*this == o); }
};

struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    constexpr Rect() = default;
    constexpr Rect(float x_, float y_, float w, float h)
        : x(x_), y(y_), width(w), height(h) {}
    constexpr Rect(Point pos, Size size)
        : x(pos.x), y(pos.y), width(size.width), height(size.height) {}

    constexpr Point position() const { return {x, y}; }
    constexpr Size size() const { return {width, height}; }
    constexpr Point center() const { return {x + width / 2, y + height / 2}; }

    constexpr float left() const { return x; }
    constexpr float top() const { return y; }
    constexpr float right() const { return x + width; }
    constexpr float bottom() const { return y + height; }

    constexpr bool isEmpty() const { return width <= 0 || height <= 0; }

    constexpr bool contains(const Point& p) const {
        return p.x >= x && p.x <= right() && p.y >= y && p.y <= bottom();
    }

    constexpr bool contains(const Rect& r) const {
        return r.x >= x && r.right() <= right() &&
               r.y >= y && r.bottom() <= bottom();
    }

    /// Interior overlap; rectangles that only share a border do not intersect
    constexpr bool intersects(const Rect& r) const {
        return x < r.right() && right() > r.x && y < r.bottom() && bottom() > r.y;
    }

    Rect united(const Rect& other) const {
        if (isEmpty()) return other;
        if (other.isEmpty()) return *this;

        float minX = std::min(x, other.x);
        float minY = std::min(y, other.y);
        float maxX = std::max(right(), other.right());
        float maxY = std::max(bottom(), other.bottom());

        return {minX, minY, maxX - minX, maxY - minY};
    }

    Rect expanded(float padding) const {
        return {x - padding, y - padding, width + 2 * padding, height + 2 * padding};
    }

    constexpr bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Rect& o) const { return !(*this == o); }
};

/// Flow direction of a diagram
enum class Direction {
    TopDown,     // Nodes stack vertically inside a group, groups run left to right
    LeftRight    // Nodes stack horizontally inside a group, groups run top to bottom
};

/// Which side of a shape's bounding box a connector attaches to
enum class AnchorSide {
    Top,
    Bottom,
    Left,
    Right
};

/// Connector line style
enum class LineStyle {
    Solid,
    Dashed
};

inline const char* toString(Direction direction) {
    return direction == Direction::LeftRight ? "LR" : "TD";
}

inline const char* toString(AnchorSide side) {
    switch (side) {
        case AnchorSide::Top: return "top";
        case AnchorSide::Bottom: return "bottom";
        case AnchorSide::Left: return "left";
        case AnchorSide::Right: return "right";
    }
    return "bottom";
}

inline const char* toString(LineStyle style) {
    return style == LineStyle::Dashed ? "dashed" : "solid";
}

/// Midpoint of the given side of a rectangle
inline Point anchorPoint(const Rect& rect, AnchorSide side) {
    switch (side) {
        case AnchorSide::Top: return {rect.x + rect.width / 2, rect.top()};
        case AnchorSide::Bottom: return {rect.x + rect.width / 2, rect.bottom()};
        case AnchorSide::Left: return {rect.left(), rect.y + rect.height / 2};
        case AnchorSide::Right: return {rect.right(), rect.y + rect.height / 2};
    }
    return rect.center();
}

}  // namespace laneflow
