#include "IOJson.h"
#include "Limits.h"
#include "PlanformTestCommon.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>

using namespace planform_test;

namespace {

class IOJsonTest : public ::testing::Test {
protected:
    // Existing document that failed loads must leave alone
    void SetUp() override {
        AddCorner(previous, "p", 1.0f, 2.0f);
    }

    void ExpectPreviousIntact() {
        ASSERT_EQ(previous.GetCorners().size(), 1u);
        EXPECT_NE(previous.FindCorner("p"), nullptr);
    }

    Model previous;
    std::string error;
};

} // namespace

TEST_F(IOJsonTest, SaveAndLoadPreservesDocument) {
    Model model;
    BuildSquare(model);
    Wall textured = *model.FindWall("ab");
    textured.frontTexture = "brick.png";
    textured.thickness = 20.0f;
    model.AddWall(textured);
    model.UpdateRooms();
    model.SetRoomName(model.GetRooms().begin()->first, "Hall");

    Item item;
    item.name = "Lamp";
    item.modelUrl = "models/lamp.glb";
    item.position = {10.0f, 0.0f, 20.0f};
    item.metadata["color"] = "red";
    const std::string itemId = model.AddItem(item);

    Model loaded;
    ASSERT_TRUE(IOJson::LoadFromString(IOJson::SaveToString(model), loaded, error))
        << error;

    EXPECT_EQ(loaded.GetCorners().size(), 4u);
    EXPECT_EQ(loaded.GetWalls().size(), 4u);
    EXPECT_FLOAT_EQ(loaded.FindCorner("c")->x, 100.0f);
    EXPECT_EQ(loaded.FindWall("ab")->frontTexture, "brick.png");
    EXPECT_FLOAT_EQ(loaded.FindWall("ab")->thickness, 20.0f);
    EXPECT_TRUE(loaded.ValidateAdjacency());

    ASSERT_EQ(loaded.GetRooms().size(), 1u);
    EXPECT_EQ(loaded.GetRooms().begin()->second.name, "Hall");

    const Item* loadedItem = loaded.FindItem(itemId);
    ASSERT_NE(loadedItem, nullptr);
    EXPECT_EQ(loadedItem->modelUrl, "models/lamp.glb");
    EXPECT_FLOAT_EQ(loadedItem->position.z, 20.0f);
    EXPECT_FLOAT_EQ(loadedItem->scale.x, 1.0f);
    EXPECT_EQ(loadedItem->metadata.at("color").get<std::string>(), "red");
    EXPECT_FALSE(loaded.dirty);
}

TEST_F(IOJsonTest, SavedDocumentIsVersioned) {
    Model model;
    BuildSquare(model);
    nlohmann::json j = nlohmann::json::parse(IOJson::SaveToString(model));

    EXPECT_EQ(j["version"], IOJson::DOCUMENT_VERSION);
    EXPECT_TRUE(j["corners"].contains("a"));
    EXPECT_EQ(j["walls"]["ab"]["startCorner"], "a");
    EXPECT_TRUE(j["rooms"].is_object());
    EXPECT_TRUE(j["items"].is_object());
}

TEST_F(IOJsonTest, ItemMetadataIsKeptAsLoaded) {
    const std::string doc = R"({
        "version": 1,
        "items": {
            "lamp": {
                "name": "Lamp",
                "metadata": {"price": 12, "dims": {"w": 2, "h": [1, 2]}}
            }
        }
    })";

    Model loaded;
    ASSERT_TRUE(IOJson::LoadFromString(doc, loaded, error)) << error;
    const Item* lamp = loaded.FindItem("lamp");
    ASSERT_NE(lamp, nullptr);
    EXPECT_EQ(lamp->metadata["price"].get<int>(), 12);
    EXPECT_EQ(lamp->metadata["dims"]["h"][1].get<int>(), 2);

    // Saving writes the same value back
    nlohmann::json saved = nlohmann::json::parse(IOJson::SaveToString(loaded));
    EXPECT_EQ(saved["items"]["lamp"]["metadata"],
              nlohmann::json::parse(R"({"price": 12, "dims": {"w": 2, "h": [1, 2]}})"));
}

TEST_F(IOJsonTest, OversizedItemMetadataIsRejected) {
    nlohmann::json meta = nlohmann::json::object();
    for (size_t i = 0; i <= Limits::MAX_ITEM_METADATA; ++i) {
        meta["k" + std::to_string(i)] = i;
    }
    nlohmann::json doc = {
        {"version", 1},
        {"items", {{"big", {{"metadata", meta}}}}}
    };

    EXPECT_FALSE(IOJson::LoadFromString(doc.dump(), previous, error));
    EXPECT_NE(error.find("big"), std::string::npos);
    ExpectPreviousIntact();
}

TEST_F(IOJsonTest, OrphanedWallIsDropped) {
    const std::string doc = R"({
        "version": 1,
        "corners": {
            "a": {"x": 0, "y": 0},
            "b": {"x": 100, "y": 0}
        },
        "walls": {
            "good": {"startCorner": "a", "endCorner": "b"},
            "orphan": {"startCorner": "a", "endCorner": "ghost"}
        }
    })";

    Model loaded;
    ASSERT_TRUE(IOJson::LoadFromString(doc, loaded, error)) << error;
    EXPECT_EQ(loaded.GetWalls().size(), 1u);
    EXPECT_EQ(loaded.FindWall("orphan"), nullptr);

    const auto& adjacent = loaded.FindCorner("a")->adjacentWalls;
    EXPECT_EQ(std::count(adjacent.begin(), adjacent.end(), "orphan"), 0);
    EXPECT_TRUE(loaded.ValidateAdjacency());
}

TEST_F(IOJsonTest, StoredAdjacencyIsRebuilt) {
    const std::string doc = R"({
        "version": 1,
        "corners": {
            "a": {"x": 0, "y": 0, "adjacentWalls": ["bogus", "w"]},
            "b": {"x": 100, "y": 0, "adjacentWalls": []}
        },
        "walls": {"w": {"startCorner": "a", "endCorner": "b"}}
    })";

    Model loaded;
    ASSERT_TRUE(IOJson::LoadFromString(doc, loaded, error)) << error;
    EXPECT_EQ(loaded.FindCorner("a")->adjacentWalls,
              std::vector<std::string>{"w"});
    EXPECT_EQ(loaded.FindCorner("b")->adjacentWalls,
              std::vector<std::string>{"w"});
}

TEST_F(IOJsonTest, MalformedJsonKeepsPreviousModel) {
    EXPECT_FALSE(IOJson::LoadFromString("{ not json", previous, error));
    EXPECT_FALSE(error.empty());
    ExpectPreviousIntact();
}

TEST_F(IOJsonTest, WrongShapeKeepsPreviousModel) {
    EXPECT_FALSE(IOJson::LoadFromString("[1, 2, 3]", previous, error));
    ExpectPreviousIntact();

    EXPECT_FALSE(IOJson::LoadFromString(R"({"corners": []})", previous, error));
    ExpectPreviousIntact();

    // Corner missing a coordinate
    EXPECT_FALSE(IOJson::LoadFromString(
        R"({"corners": {"a": {"x": 1}}})", previous, error));
    ExpectPreviousIntact();
}

TEST_F(IOJsonTest, UnsupportedVersionIsRejected) {
    EXPECT_FALSE(IOJson::LoadFromString(R"({"version": 99})", previous, error));
    EXPECT_NE(error.find("99"), std::string::npos);
    ExpectPreviousIntact();
}

TEST_F(IOJsonTest, OutOfRangeCoordinateIsRejected) {
    EXPECT_FALSE(IOJson::LoadFromString(
        R"({"corners": {"a": {"x": 1e12, "y": 0}}})", previous, error));
    ExpectPreviousIntact();
}

TEST_F(IOJsonTest, FileRoundTrip) {
    const std::filesystem::path path =
        std::filesystem::temp_directory_path() / "planform_iojson_test.json";

    Model model;
    BuildSquare(model);
    ASSERT_TRUE(IOJson::SaveToFile(model, path.string(), error)) << error;

    Model loaded;
    ASSERT_TRUE(IOJson::LoadFromFile(path.string(), loaded, error)) << error;
    EXPECT_EQ(loaded.GetWalls().size(), 4u);

    std::filesystem::remove(path);
    EXPECT_FALSE(IOJson::LoadFromFile(path.string(), previous, error));
    ExpectPreviousIntact();
}
