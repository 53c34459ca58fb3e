#include "Preferences.h"
#include "platform/Fs.h"
#include "platform/Paths.h"
#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>

namespace Planform {

// ============================================================================
// Valid ranges
// ============================================================================

namespace {

constexpr float MIN_WALL_HEIGHT = 50.0f;
constexpr float MAX_WALL_HEIGHT = 1000.0f;
constexpr float MIN_WALL_THICKNESS = 1.0f;
constexpr float MAX_WALL_THICKNESS = 100.0f;
constexpr float MIN_GRID_SIZE = 5.0f;
constexpr float MAX_GRID_SIZE = 200.0f;
constexpr float MIN_SNAP_TOLERANCE = 1.0f;
constexpr float MAX_SNAP_TOLERANCE = 100.0f;

} // namespace

bool Preferences::LoadFromFile(const std::string& path) {
    auto content = Platform::ReadTextFile(path);
    if (!content) {
        SDL_Log("No preferences at %s, using defaults", path.c_str());
        return false;
    }
    return LoadFromString(*content);
}

bool Preferences::LoadFromString(const std::string& json) {
    try {
        nlohmann::json j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "Preferences: expected a JSON object");
            return false;
        }

        // Read into a copy so a type error halfway leaves us unchanged
        Preferences loaded = *this;
        loaded.wallHeight = j.value("wallHeight", wallHeight);
        loaded.wallThickness = j.value("wallThickness", wallThickness);
        loaded.gridSize = j.value("gridSize", gridSize);
        loaded.snapTolerance = j.value("snapTolerance", snapTolerance);
        loaded.Clamp();

        *this = loaded;
        return true;
    } catch (const nlohmann::json::exception& e) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "Preferences: parse error: %s", e.what());
        return false;
    }
}

std::string Preferences::SaveToString() const {
    nlohmann::json j;
    j["wallHeight"] = wallHeight;
    j["wallThickness"] = wallThickness;
    j["gridSize"] = gridSize;
    j["snapTolerance"] = snapTolerance;
    return j.dump(2);
}

bool Preferences::SaveToFile(const std::string& path) const {
    std::string dir = std::filesystem::path(path).parent_path().string();
    if (!dir.empty() && !Platform::EnsureDirectoryExists(dir)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Preferences: cannot create %s", dir.c_str());
        return false;
    }

    if (!Platform::WriteTextFile(path, SaveToString())) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Preferences: cannot write %s", path.c_str());
        return false;
    }
    return true;
}

std::string Preferences::GetDefaultPath() {
    return Platform::GetUserDataDir() + "preferences.json";
}

void Preferences::ResetToDefaults() {
    *this = Preferences();
}

void Preferences::Clamp() {
    wallHeight = std::clamp(wallHeight, MIN_WALL_HEIGHT, MAX_WALL_HEIGHT);
    wallThickness = std::clamp(
        wallThickness, MIN_WALL_THICKNESS, MAX_WALL_THICKNESS);
    gridSize = std::clamp(gridSize, MIN_GRID_SIZE, MAX_GRID_SIZE);
    snapTolerance = std::clamp(
        snapTolerance, MIN_SNAP_TOLERANCE, MAX_SNAP_TOLERANCE);
}

} // namespace Planform
