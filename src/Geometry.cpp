#include "Geometry.h"
#include <algorithm>
#include <cmath>

namespace Planform {
namespace Geometry {

float Distance(const Point2D& p1, const Point2D& p2) {
    float dx = p2.x - p1.x;
    float dy = p2.y - p1.y;
    return std::sqrt(dx * dx + dy * dy);
}

float PointToSegmentDistance(
    const Point2D& p,
    const Point2D& a,
    const Point2D& b
) {
    float vx = b.x - a.x;
    float vy = b.y - a.y;
    float lenSq = vx * vx + vy * vy;

    if (lenSq == 0.0f) {
        return Distance(p, a);
    }

    float t = ((p.x - a.x) * vx + (p.y - a.y) * vy) / lenSq;
    t = std::clamp(t, 0.0f, 1.0f);

    Point2D closest(a.x + t * vx, a.y + t * vy);
    return Distance(p, closest);
}

bool PointInPolygon(const Point2D& p, const std::vector<Point2D>& polygon) {
    bool inside = false;
    const size_t n = polygon.size();

    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point2D& pi = polygon[i];
        const Point2D& pj = polygon[j];

        // Edge straddles the horizontal ray through p
        if ((pi.y > p.y) != (pj.y > p.y)) {
            float xCross = (pj.x - pi.x) * (p.y - pi.y) / (pj.y - pi.y) + pi.x;
            if (p.x < xCross) {
                inside = !inside;
            }
        }
    }

    return inside;
}

float PolygonArea(const std::vector<Point2D>& points) {
    if (points.size() < 3) {
        return 0.0f;
    }

    float area = 0.0f;
    for (size_t i = 0; i < points.size(); ++i) {
        size_t j = (i + 1) % points.size();
        area += points[i].x * points[j].y;
        area -= points[j].x * points[i].y;
    }
    return std::fabs(area) / 2.0f;
}

Point2D PolygonCentroid(const std::vector<Point2D>& points) {
    if (points.empty()) {
        return Point2D();
    }

    float x = 0.0f;
    float y = 0.0f;
    for (const auto& point : points) {
        x += point.x;
        y += point.y;
    }

    const float n = static_cast<float>(points.size());
    return Point2D(x / n, y / n);
}

Point2D SnapToGrid(const Point2D& point, float gridSize) {
    if (gridSize <= 0.0f) {
        return point;
    }
    return Point2D(
        std::round(point.x / gridSize) * gridSize,
        std::round(point.y / gridSize) * gridSize
    );
}

Point2D RotatePoint(const Point2D& point, float angle, const Point2D& origin) {
    float c = std::cos(angle);
    float s = std::sin(angle);
    float dx = point.x - origin.x;
    float dy = point.y - origin.y;

    return Point2D(
        origin.x + dx * c - dy * s,
        origin.y + dx * s + dy * c
    );
}

float Angle(const Point2D& p1, const Point2D& p2) {
    return std::atan2(p2.y - p1.y, p2.x - p1.x);
}

bool PointsEqual(const Point2D& p1, const Point2D& p2, float tolerance) {
    return Distance(p1, p2) < tolerance;
}

} // namespace Geometry
} // namespace Planform
