#include "Viewport.h"
#include <gtest/gtest.h>

using namespace Planform;

TEST(ViewportTest, DefaultsToTwoCentimetersPerPixel) {
    Viewport viewport;
    EXPECT_FLOAT_EQ(viewport.GetZoom(), 1.0f);
    EXPECT_FLOAT_EQ(viewport.GetCmPerPixel(), 2.0f);
    EXPECT_FLOAT_EQ(viewport.GetPixelsPerCm(), 0.5f);

    Point2D world = viewport.WorldFromDevice(50.0f, 25.0f);
    EXPECT_FLOAT_EQ(world.x, 100.0f);
    EXPECT_FLOAT_EQ(world.y, 50.0f);
}

TEST(ViewportTest, DeviceWorldRoundTrip) {
    Viewport viewport;
    viewport.SetZoom(1.7f);
    viewport.SetOrigin(-42.0f, 13.5f);

    for (const Point2D& p : {Point2D(0, 0), Point2D(123.4f, -56.7f),
                             Point2D(-1000.0f, 2500.0f)}) {
        Point2D back = viewport.WorldFromDevice(viewport.DeviceFromWorld(p));
        EXPECT_NEAR(back.x, p.x, 1e-2f);
        EXPECT_NEAR(back.y, p.y, 1e-2f);
    }
}

TEST(ViewportTest, PanShiftsOriginOppositeToDrag) {
    Viewport viewport;
    Point2D before = viewport.WorldFromDevice(100.0f, 100.0f);
    viewport.Pan(10.0f, -5.0f);

    // The content follows the pointer
    Point2D after = viewport.WorldFromDevice(110.0f, 95.0f);
    EXPECT_NEAR(after.x, before.x, 1e-4f);
    EXPECT_NEAR(after.y, before.y, 1e-4f);
    EXPECT_FLOAT_EQ(viewport.GetOriginX(), -10.0f);
    EXPECT_FLOAT_EQ(viewport.GetOriginY(), 5.0f);
}

TEST(ViewportTest, ZoomAtKeepsPointUnderCursor) {
    Viewport viewport;
    viewport.SetOrigin(30.0f, -20.0f);
    const float cx = 320.0f;
    const float cy = 180.0f;

    Point2D anchor = viewport.WorldFromDevice(cx, cy);
    viewport.ZoomAt(-1.0f, cx, cy);
    EXPECT_FLOAT_EQ(viewport.GetZoom(), 1.25f);

    Point2D after = viewport.WorldFromDevice(cx, cy);
    EXPECT_NEAR(after.x, anchor.x, 1e-2f);
    EXPECT_NEAR(after.y, anchor.y, 1e-2f);

    viewport.ZoomAt(1.0f, cx, cy);
    after = viewport.WorldFromDevice(cx, cy);
    EXPECT_NEAR(after.x, anchor.x, 1e-2f);
    EXPECT_NEAR(after.y, anchor.y, 1e-2f);
}

TEST(ViewportTest, ZoomIsClamped) {
    Viewport viewport;
    for (int i = 0; i < 50; ++i) {
        viewport.ZoomAt(-1.0f, 0.0f, 0.0f);
    }
    EXPECT_FLOAT_EQ(viewport.GetZoom(), Viewport::MAX_ZOOM);
    EXPECT_FLOAT_EQ(viewport.GetCmPerPixel(), 2.0f / Viewport::MAX_ZOOM);

    for (int i = 0; i < 50; ++i) {
        viewport.ZoomAt(1.0f, 0.0f, 0.0f);
    }
    EXPECT_FLOAT_EQ(viewport.GetZoom(), Viewport::MIN_ZOOM);
    EXPECT_FLOAT_EQ(viewport.GetCmPerPixel() * viewport.GetPixelsPerCm(), 1.0f);
}

TEST(ViewportTest, DeviceSizeIsNonNegative) {
    Viewport viewport;
    viewport.SetDeviceSize(800, 600);
    EXPECT_EQ(viewport.GetDeviceWidth(), 800);
    EXPECT_EQ(viewport.GetDeviceHeight(), 600);

    viewport.SetDeviceSize(-1, 10);
    EXPECT_EQ(viewport.GetDeviceWidth(), 0);
}
