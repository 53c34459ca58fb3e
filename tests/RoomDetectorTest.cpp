#include "RoomDetector.h"
#include "PlanformTestCommon.h"
#include <set>

using namespace planform_test;

namespace {

std::set<std::string> AsSet(const std::vector<std::string>& ids) {
    return std::set<std::string>(ids.begin(), ids.end());
}

} // namespace

TEST(RoomDetectorTest, EmptyGraphHasNoRooms) {
    Model model;
    EXPECT_TRUE(RoomDetector::FindCycles(model).empty());
}

TEST(RoomDetectorTest, SquareIsOneRoom) {
    Model model;
    BuildSquare(model);

    auto cycles = RoomDetector::FindCycles(model);
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(AsSet(cycles[0]), (std::set<std::string>{"a", "b", "c", "d"}));
    EXPECT_EQ(cycles[0].size(), 4u);
}

TEST(RoomDetectorTest, OpenChainIsNotARoom) {
    Model model;
    BuildSquare(model);
    model.RemoveWall("da");
    EXPECT_TRUE(RoomDetector::FindCycles(model).empty());
}

TEST(RoomDetectorTest, TriangleWithDanglingWall) {
    Model model;
    AddCorner(model, "a", 0, 0);
    AddCorner(model, "b", 100, 0);
    AddCorner(model, "c", 50, 100);
    AddCorner(model, "tail", 200, 0);
    AddWall(model, "ab", "a", "b");
    AddWall(model, "bc", "b", "c");
    AddWall(model, "ca", "c", "a");
    AddWall(model, "bt", "b", "tail");

    auto cycles = RoomDetector::FindCycles(model);
    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(AsSet(cycles[0]), (std::set<std::string>{"a", "b", "c"}));
}

TEST(RoomDetectorTest, ParallelWallsAreNotARoom) {
    Model model;
    AddCorner(model, "a", 0, 0);
    AddCorner(model, "b", 100, 0);
    AddWall(model, "w1", "a", "b");
    AddWall(model, "w2", "a", "b");
    EXPECT_TRUE(RoomDetector::FindCycles(model).empty());
}

TEST(RoomDetectorTest, SelfLoopIsIgnored) {
    Model model;
    AddCorner(model, "a", 0, 0);
    AddWall(model, "loop", "a", "a");
    EXPECT_TRUE(RoomDetector::FindCycles(model).empty());
}

TEST(RoomDetectorTest, DisjointSquaresAreSeparateRooms) {
    Model model;
    BuildSquare(model);
    AddCorner(model, "e", 300, 0);
    AddCorner(model, "f", 400, 0);
    AddCorner(model, "g", 400, 100);
    AddCorner(model, "h", 300, 100);
    AddWall(model, "ef", "e", "f");
    AddWall(model, "fg", "f", "g");
    AddWall(model, "gh", "g", "h");
    AddWall(model, "he", "h", "e");

    auto cycles = RoomDetector::FindCycles(model);
    ASSERT_EQ(cycles.size(), 2u);
    EXPECT_EQ(AsSet(cycles[0]), (std::set<std::string>{"a", "b", "c", "d"}));
    EXPECT_EQ(AsSet(cycles[1]), (std::set<std::string>{"e", "f", "g", "h"}));
}

TEST(RoomDetectorTest, EveryCycleIsClosedByWalls) {
    Model model;
    BuildSquare(model);
    // Diagonal splits the square into two triangles
    AddWall(model, "ac", "a", "c");

    for (const auto& cycle : RoomDetector::FindCycles(model)) {
        ASSERT_GE(cycle.size(), 3u);
        for (size_t i = 0; i < cycle.size(); ++i) {
            const std::string& from = cycle[i];
            const std::string& to = cycle[(i + 1) % cycle.size()];
            bool joined = false;
            for (const auto& [id, wall] : model.GetWalls()) {
                if ((wall.startCorner == from && wall.endCorner == to) ||
                    (wall.startCorner == to && wall.endCorner == from)) {
                    joined = true;
                }
            }
            EXPECT_TRUE(joined) << from << " -> " << to;
        }
    }
}
