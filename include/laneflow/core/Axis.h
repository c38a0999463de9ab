#pragma once

#include "Types.h"

namespace laneflow {

/// Primary/cross axis helpers.
///
/// The primary axis is the stacking direction inside a group: vertical for
/// top-down diagrams, horizontal for left-right diagrams. The cross axis is
/// orthogonal to it. All layout passes work in (primary, cross) terms and
/// convert back to (x, y) through these helpers.
namespace axis {

constexpr bool isVertical(Direction d) { return d == Direction::TopDown; }

constexpr float primary(const Size& s, Direction d) {
    return isVertical(d) ? s.height : s.width;
}

constexpr float cross(const Size& s, Direction d) {
    return isVertical(d) ? s.width : s.height;
}

constexpr float primary(const Point& p, Direction d) {
    return isVertical(d) ? p.y : p.x;
}

constexpr float cross(const Point& p, Direction d) {
    return isVertical(d) ? p.x : p.y;
}

constexpr Size makeSize(float primaryExtent, float crossExtent, Direction d) {
    return isVertical(d) ? Size{crossExtent, primaryExtent}
                         : Size{primaryExtent, crossExtent};
}

constexpr Point makePoint(float primaryCoord, float crossCoord, Direction d) {
    return isVertical(d) ? Point{crossCoord, primaryCoord}
                         : Point{primaryCoord, crossCoord};
}

constexpr float primaryStart(const Rect& r, Direction d) {
    return isVertical(d) ? r.top() : r.left();
}

constexpr float primaryEnd(const Rect& r, Direction d) {
    return isVertical(d) ? r.bottom() : r.right();
}

constexpr float crossStart(const Rect& r, Direction d) {
    return isVertical(d) ? r.left() : r.top();
}

constexpr float crossEnd(const Rect& r, Direction d) {
    return isVertical(d) ? r.right() : r.bottom();
}

}  // namespace axis
}  // namespace laneflow
