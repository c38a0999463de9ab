#pragma once

#include "Types.h"

#include <vector>

namespace laneflow {

/// Geometry helpers for route validation
namespace geometry {

/// Check if a line segment intersects an axis-aligned rectangle (border included)
bool segmentIntersectsRect(const Point& p1, const Point& p2, const Rect& rect);

/// Check if a segment enters the rectangle's interior. The rectangle is shrunk
/// by @p tolerance first, so segments running along a border do not count.
bool segmentPenetratesRect(const Point& p1, const Point& p2, const Rect& rect,
                           float tolerance = 1.0f);

/// True if any segment of the polyline penetrates the rectangle's interior
bool polylinePenetratesRect(const std::vector<Point>& points, const Rect& rect,
                            float tolerance = 1.0f);

}  // namespace geometry
}  // namespace laneflow
