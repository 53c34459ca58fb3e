#include "Preferences.h"
#include <gtest/gtest.h>
#include <filesystem>

using namespace Planform;

TEST(PreferencesTest, Defaults) {
    Preferences prefs;
    EXPECT_FLOAT_EQ(prefs.wallHeight, 250.0f);
    EXPECT_FLOAT_EQ(prefs.wallThickness, 10.0f);
    EXPECT_FLOAT_EQ(prefs.gridSize, 20.0f);
    EXPECT_FLOAT_EQ(prefs.snapTolerance, 15.0f);
}

TEST(PreferencesTest, LoadOverridesPresentKeysOnly) {
    Preferences prefs;
    ASSERT_TRUE(prefs.LoadFromString(R"({"wallHeight": 300, "gridSize": 40})"));
    EXPECT_FLOAT_EQ(prefs.wallHeight, 300.0f);
    EXPECT_FLOAT_EQ(prefs.gridSize, 40.0f);
    EXPECT_FLOAT_EQ(prefs.wallThickness, Preferences::DEFAULT_WALL_THICKNESS);
}

TEST(PreferencesTest, ValuesAreClamped) {
    Preferences prefs;
    ASSERT_TRUE(prefs.LoadFromString(
        R"({"wallHeight": 1, "wallThickness": 5000, "gridSize": 0, "snapTolerance": -4})"));
    EXPECT_FLOAT_EQ(prefs.wallHeight, 50.0f);
    EXPECT_FLOAT_EQ(prefs.wallThickness, 100.0f);
    EXPECT_FLOAT_EQ(prefs.gridSize, 5.0f);
    EXPECT_FLOAT_EQ(prefs.snapTolerance, 1.0f);
}

TEST(PreferencesTest, MalformedInputLeavesValuesUnchanged) {
    Preferences prefs;
    prefs.wallHeight = 280.0f;

    EXPECT_FALSE(prefs.LoadFromString("{ broken"));
    EXPECT_FALSE(prefs.LoadFromString("[]"));
    EXPECT_FALSE(prefs.LoadFromString(R"({"wallHeight": 300, "gridSize": "big"})"));
    EXPECT_FLOAT_EQ(prefs.wallHeight, 280.0f);
    EXPECT_FLOAT_EQ(prefs.gridSize, 20.0f);
}

TEST(PreferencesTest, MissingFileFallsBackToDefaults) {
    Preferences prefs;
    EXPECT_FALSE(prefs.LoadFromFile("/nonexistent/planform/preferences.json"));
    EXPECT_FLOAT_EQ(prefs.wallHeight, Preferences::DEFAULT_WALL_HEIGHT);
}

TEST(PreferencesTest, SaveAndLoadFile) {
    const std::filesystem::path dir =
        std::filesystem::temp_directory_path() / "planform_prefs_test";
    const std::string path = (dir / "preferences.json").string();
    std::filesystem::remove_all(dir);

    Preferences saved;
    saved.wallThickness = 15.0f;
    saved.snapTolerance = 20.0f;
    ASSERT_TRUE(saved.SaveToFile(path));

    Preferences loaded;
    ASSERT_TRUE(loaded.LoadFromFile(path));
    EXPECT_FLOAT_EQ(loaded.wallThickness, 15.0f);
    EXPECT_FLOAT_EQ(loaded.snapTolerance, 20.0f);

    loaded.ResetToDefaults();
    EXPECT_FLOAT_EQ(loaded.wallThickness, Preferences::DEFAULT_WALL_THICKNESS);

    std::filesystem::remove_all(dir);
}

TEST(PreferencesTest, DefaultPathIsInUserDataDir) {
    const std::string path = Preferences::GetDefaultPath();
    EXPECT_NE(path.find("preferences.json"), std::string::npos);
}
