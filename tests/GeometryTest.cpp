#include "Geometry.h"
#include <gtest/gtest.h>
#include <vector>

using namespace Planform;

namespace {

constexpr float kPi = 3.14159265358979f;

const std::vector<Point2D> kSquare = {
    Point2D(0, 0), Point2D(10, 0), Point2D(10, 10), Point2D(0, 10)
};

} // namespace

TEST(GeometryTest, DistanceIsEuclidean) {
    EXPECT_FLOAT_EQ(Geometry::Distance(Point2D(0, 0), Point2D(3, 4)), 5.0f);
    EXPECT_FLOAT_EQ(Geometry::Distance(Point2D(2, 2), Point2D(2, 2)), 0.0f);
}

TEST(GeometryTest, PointToSegmentDistanceClampsToEndpoints) {
    const Point2D a(0, 0);
    const Point2D b(100, 0);
    EXPECT_FLOAT_EQ(Geometry::PointToSegmentDistance(Point2D(50, 20), a, b), 20.0f);
    EXPECT_FLOAT_EQ(Geometry::PointToSegmentDistance(Point2D(-30, 40), a, b), 50.0f);
    EXPECT_FLOAT_EQ(Geometry::PointToSegmentDistance(Point2D(130, 40), a, b), 50.0f);
}

TEST(GeometryTest, PointToSegmentDistanceOnDegenerateSegment) {
    const Point2D a(5, 5);
    EXPECT_FLOAT_EQ(Geometry::PointToSegmentDistance(Point2D(8, 9), a, a), 5.0f);
}

TEST(GeometryTest, PointInPolygonSquare) {
    EXPECT_TRUE(Geometry::PointInPolygon(Point2D(5, 5), kSquare));
    EXPECT_FALSE(Geometry::PointInPolygon(Point2D(15, 15), kSquare));
    EXPECT_FALSE(Geometry::PointInPolygon(Point2D(5, 5), {}));
}

TEST(GeometryTest, PolygonAreaIsOrientationIndependent) {
    EXPECT_FLOAT_EQ(Geometry::PolygonArea(kSquare), 100.0f);

    std::vector<Point2D> reversed(kSquare.rbegin(), kSquare.rend());
    EXPECT_FLOAT_EQ(Geometry::PolygonArea(reversed), 100.0f);
}

TEST(GeometryTest, PolygonAreaOfDegenerateInputIsZero) {
    EXPECT_FLOAT_EQ(Geometry::PolygonArea({}), 0.0f);
    EXPECT_FLOAT_EQ(Geometry::PolygonArea({Point2D(0, 0), Point2D(5, 5)}), 0.0f);
}

TEST(GeometryTest, PolygonCentroidIsVertexMean) {
    Point2D c = Geometry::PolygonCentroid(kSquare);
    EXPECT_FLOAT_EQ(c.x, 5.0f);
    EXPECT_FLOAT_EQ(c.y, 5.0f);

    Point2D empty = Geometry::PolygonCentroid({});
    EXPECT_FLOAT_EQ(empty.x, 0.0f);
    EXPECT_FLOAT_EQ(empty.y, 0.0f);
}

TEST(GeometryTest, SnapToGridRoundsToNearest) {
    Point2D p = Geometry::SnapToGrid(Point2D(29.0f, -31.0f), 20.0f);
    EXPECT_FLOAT_EQ(p.x, 20.0f);
    EXPECT_FLOAT_EQ(p.y, -40.0f);
}

TEST(GeometryTest, SnapToGridIsIdempotent) {
    const float grid = 40.0f;
    for (float v : {-123.4f, -20.0f, 0.0f, 7.5f, 19.99f, 61.0f, 1234.5f}) {
        Point2D once = Geometry::SnapToGrid(Point2D(v, -v), grid);
        Point2D twice = Geometry::SnapToGrid(once, grid);
        EXPECT_EQ(once, twice) << "value " << v;
    }
}

TEST(GeometryTest, SnapToGridIgnoresNonPositiveSize) {
    Point2D p(3.3f, 4.4f);
    EXPECT_EQ(Geometry::SnapToGrid(p, 0.0f), p);
    EXPECT_EQ(Geometry::SnapToGrid(p, -5.0f), p);
}

TEST(GeometryTest, RotatePointAroundOrigin) {
    Point2D r = Geometry::RotatePoint(Point2D(10, 0), kPi / 2.0f);
    EXPECT_NEAR(r.x, 0.0f, 1e-4f);
    EXPECT_NEAR(r.y, 10.0f, 1e-4f);

    Point2D around = Geometry::RotatePoint(
        Point2D(20, 10), kPi, Point2D(10, 10));
    EXPECT_NEAR(around.x, 0.0f, 1e-4f);
    EXPECT_NEAR(around.y, 10.0f, 1e-4f);
}

TEST(GeometryTest, AngleAndPointsEqual) {
    EXPECT_NEAR(Geometry::Angle(Point2D(0, 0), Point2D(0, 5)),
                kPi / 2.0f, 1e-5f);
    EXPECT_TRUE(Geometry::PointsEqual(Point2D(0, 0), Point2D(5, 5)));
    EXPECT_FALSE(Geometry::PointsEqual(Point2D(0, 0), Point2D(10, 10)));
    EXPECT_TRUE(Geometry::PointsEqual(Point2D(0, 0), Point2D(1, 0), 2.0f));
}
