#include "laneflow/core/GeometryUtils.h"

#include <algorithm>
#include <cmath>

namespace laneflow::geometry {

bool segmentIntersectsRect(const Point& p1, const Point& p2, const Rect& rect) {
    // Segment bounding box
    float segMinX = std::min(p1.x, p2.x);
    float segMaxX = std::max(p1.x, p2.x);
    float segMinY = std::min(p1.y, p2.y);
    float segMaxY = std::max(p1.y, p2.y);

    if (segMaxX < rect.left() || segMinX > rect.right() ||
        segMaxY < rect.top() || segMinY > rect.bottom()) {
        return false;
    }

    // Orthogonal segments: overlapping bounding boxes means intersection
    bool isVertical = std::abs(p1.x - p2.x) < 0.001f;
    bool isHorizontal = std::abs(p1.y - p2.y) < 0.001f;
    if (isVertical || isHorizontal) {
        return true;
    }

    // Diagonal segments: reject when all corners lie on the same side
    auto sign = [](float v) { return v > 0 ? 1 : (v < 0 ? -1 : 0); };

    float dx = p2.x - p1.x;
    float dy = p2.y - p1.y;

    auto crossSign = [&](float cx, float cy) {
        return sign((cx - p1.x) * dy - (cy - p1.y) * dx);
    };

    int s1 = crossSign(rect.left(), rect.top());
    int s2 = crossSign(rect.right(), rect.top());
    int s3 = crossSign(rect.right(), rect.bottom());
    int s4 = crossSign(rect.left(), rect.bottom());

    return !(s1 == s2 && s2 == s3 && s3 == s4 && s1 != 0);
}

bool segmentPenetratesRect(const Point& p1, const Point& p2, const Rect& rect, float tolerance) {
    Rect interior = rect.expanded(-tolerance);
    if (interior.isEmpty()) {
        return false;
    }
    return segmentIntersectsRect(p1, p2, interior);
}

bool polylinePenetratesRect(const std::vector<Point>& points, const Rect& rect, float tolerance) {
    for (size_t i = 1; i < points.size(); ++i) {
        if (segmentPenetratesRect(points[i - 1], points[i], rect, tolerance)) {
            return true;
        }
    }
    return false;
}

}  // namespace laneflow::geometry
