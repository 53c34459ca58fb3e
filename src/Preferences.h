#pragma once

#include <string>

namespace Planform {

/**
 * Editor settings persisted as preferences.json in the user data directory.
 * Values are read when new geometry is created, so changing them never
 * alters walls that already exist.
 */
class Preferences {
public:
    static constexpr float DEFAULT_WALL_HEIGHT = 250.0f;    // cm
    static constexpr float DEFAULT_WALL_THICKNESS = 10.0f;  // cm
    static constexpr float DEFAULT_GRID_SIZE = 20.0f;       // device px
    static constexpr float DEFAULT_SNAP_TOLERANCE = 15.0f;  // device px

    /**
     * Load preferences from a JSON file.
     * A missing or malformed file leaves the current values untouched.
     * @param path File path
     * @return true if the file was read and parsed
     */
    bool LoadFromFile(const std::string& path);

    /**
     * Parse preferences from a JSON string. Absent keys keep their current
     * value; present keys are clamped to a usable range.
     * @param json JSON text
     * @return false on parse error (values unchanged)
     */
    bool LoadFromString(const std::string& json);

    /**
     * Save preferences, creating the parent directory if needed.
     * @param path File path
     * @return true on success
     */
    bool SaveToFile(const std::string& path) const;

    std::string SaveToString() const;

    // preferences.json inside the platform user data directory
    static std::string GetDefaultPath();

    // Restore every value to its default
    void ResetToDefaults();

    // Preference values
    float wallHeight = DEFAULT_WALL_HEIGHT;
    float wallThickness = DEFAULT_WALL_THICKNESS;
    float gridSize = DEFAULT_GRID_SIZE;
    float snapTolerance = DEFAULT_SNAP_TOLERANCE;

private:
    void Clamp();
};

} // namespace Planform
