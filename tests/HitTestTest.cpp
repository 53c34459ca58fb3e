#include "HitTest.h"
#include "PlanformTestCommon.h"
#include "Viewport.h"

using namespace planform_test;

namespace {

class HitTestTest : public ::testing::Test {
protected:
    void SetUp() override {
        AddCorner(model, "a", 0, 0);
        AddCorner(model, "b", 100, 0);
        AddWall(model, "w", "a", "b");
    }

    Model model;
    Viewport viewport;  // cmPerPixel = 2
};

} // namespace

TEST_F(HitTestTest, WallToleranceScalesWithZoom) {
    HitTester hitTester(model, viewport);

    // 15 px at 2 cm/px is 30 cm
    const Wall* hit = hitTester.FindWallAt(50, 20);
    ASSERT_NE(hit, nullptr);
    EXPECT_EQ(hit->id, "w");
    EXPECT_EQ(hitTester.FindWallAt(50, 40), nullptr);

    viewport.SetZoom(0.5f);  // 4 cm/px, 60 cm tolerance
    EXPECT_NE(hitTester.FindWallAt(50, 40), nullptr);
}

TEST_F(HitTestTest, ToleranceBoundaryIsExclusive) {
    HitTester hitTester(model, viewport);
    EXPECT_EQ(hitTester.FindWallAt(50, 30), nullptr);
    EXPECT_NE(hitTester.FindWallAt(50, 29.9f), nullptr);
}

TEST_F(HitTestTest, CornerTakesPriorityOverWall) {
    HitTester hitTester(model, viewport);

    HitResult result = hitTester.HitAt(5, 5);
    EXPECT_TRUE(result.IsCorner());
    EXPECT_EQ(result.id, "a");

    result = hitTester.HitAt(50, 5);
    EXPECT_TRUE(result.IsWall());
    EXPECT_EQ(result.id, "w");

    result = hitTester.HitAt(50, 200);
    EXPECT_TRUE(result.IsNone());
    EXPECT_TRUE(result.id.empty());
}

TEST_F(HitTestTest, SeparateCornerAndWallTolerances) {
    HitTester hitTester(model, viewport);

    // 40 cm from the wall: only a 20 px wall tolerance reaches it
    EXPECT_TRUE(hitTester.HitAt(50, 40, 15.0f, 15.0f).IsNone());
    EXPECT_TRUE(hitTester.HitAt(50, 40, 15.0f, 20.0f).IsWall());
}

TEST_F(HitTestTest, DegenerateWallsAreNotPickable) {
    AddCorner(model, "c", 500, 500);
    AddCorner(model, "d", 500, 500);
    AddWall(model, "zero", "c", "d");

    HitTester hitTester(model, viewport);
    EXPECT_EQ(hitTester.FindWallAt(500, 500), nullptr);

    const Corner* corner = hitTester.FindCornerAt(502, 501);
    ASSERT_NE(corner, nullptr);
    EXPECT_EQ(corner->id, "c");  // First in store order
}
