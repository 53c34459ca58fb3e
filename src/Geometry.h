#pragma once

#include <vector>

namespace Planform {

/**
 * 2D point in world centimeters.
 */
struct Point2D {
    float x = 0.0f;
    float y = 0.0f;

    Point2D() = default;
    Point2D(float x, float y) : x(x), y(y) {}

    bool operator==(const Point2D& other) const {
        return x == other.x && y == other.y;
    }
    bool operator!=(const Point2D& other) const {
        return !(*this == other);
    }
};

/**
 * Stateless point/segment/polygon math.
 * Every function is total: degenerate input yields a defined result.
 */
namespace Geometry {

float Distance(const Point2D& p1, const Point2D& p2);

/**
 * Distance from p to segment [a, b].
 * Falls back to the distance to a when the segment has zero length.
 */
float PointToSegmentDistance(
    const Point2D& p,
    const Point2D& a,
    const Point2D& b
);

/**
 * Ray-casting parity test. Points exactly on an edge may land either way.
 */
bool PointInPolygon(const Point2D& p, const std::vector<Point2D>& polygon);

/**
 * Shoelace area (absolute). Returns 0 for fewer than 3 points.
 */
float PolygonArea(const std::vector<Point2D>& points);

/**
 * Arithmetic mean of the vertices (not area-weighted).
 * Returns (0, 0) for an empty list.
 */
Point2D PolygonCentroid(const std::vector<Point2D>& points);

/**
 * Round each axis to the nearest multiple of gridSize.
 * A non-positive gridSize returns the point unchanged.
 */
Point2D SnapToGrid(const Point2D& point, float gridSize);

/**
 * Rotate point by angle (radians) around origin.
 */
Point2D RotatePoint(
    const Point2D& point,
    float angle,
    const Point2D& origin = Point2D()
);

// Direction from p1 to p2 in radians
float Angle(const Point2D& p1, const Point2D& p2);

bool PointsEqual(const Point2D& p1, const Point2D& p2, float tolerance = 10.0f);

} // namespace Geometry
} // namespace Planform
