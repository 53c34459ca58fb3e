#pragma once

#include "Geometry.h"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Planform {

// ============================================================================
// Corners and walls (the wall graph)
// ============================================================================

struct Corner {
    std::string id;
    float x = 0.0f;                         // World centimeters
    float y = 0.0f;
    std::vector<std::string> adjacentWalls; // Ids of walls referencing this

    Point2D Position() const { return Point2D(x, y); }
};

struct Wall {
    std::string id;
    std::string startCorner;
    std::string endCorner;
    float thickness = 10.0f;   // cm
    float height = 250.0f;     // cm
    std::string frontTexture;  // Empty if unset
    std::string backTexture;
};

// ============================================================================
// Rooms (derived from wall cycles)
// ============================================================================

struct Room {
    std::string id;
    std::vector<std::string> corners;  // Ordered cycle of corner ids
    std::string name;
    std::string floorTexture;
};

// ============================================================================
// Items (3D placements, opaque to the 2D editor)
// ============================================================================

struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

struct Item {
    std::string id;
    std::string name;
    std::string modelUrl;
    Vec3 position;
    Vec3 rotation;
    Vec3 scale = {1.0f, 1.0f, 1.0f};
    nlohmann::json metadata = nlohmann::json::object(); // Opaque
};

// ============================================================================
// Model - Complete floor plan document
// ============================================================================

/**
 * Owns the corner/wall graph plus the room cache and placed items.
 * All mutation goes through the member functions below so that every
 * corner's adjacency list stays equal to the set of walls referencing it.
 */
class Model {
public:
    Model();

    // Read access (non-owning pointers, valid until the entry is removed)
    const std::map<std::string, Corner>& GetCorners() const { return m_corners; }
    const std::map<std::string, Wall>& GetWalls() const { return m_walls; }
    const std::map<std::string, Room>& GetRooms() const { return m_rooms; }
    const std::map<std::string, Item>& GetItems() const { return m_items; }
    const Corner* FindCorner(const std::string& id) const;
    const Wall* FindWall(const std::string& id) const;
    const Room* FindRoom(const std::string& id) const;
    const Item* FindItem(const std::string& id) const;

    // Corner operations
    /**
     * Insert a corner under its own id. An existing entry with the same id
     * is overwritten in place. The caller's adjacentWalls are ignored:
     * adjacency always comes from the walls held by the model.
     */
    void AddCorner(const Corner& corner);

    /**
     * Reposition a corner. Wall geometry is not validated.
     * @return false if the corner does not exist
     */
    bool MoveCorner(const std::string& id, float x, float y);

    /**
     * Remove a corner and every wall attached to it.
     * @return false if the corner does not exist
     */
    bool RemoveCorner(const std::string& id);

    // Wall operations
    /**
     * Insert a wall and register it in both endpoints' adjacency.
     * @param wall Wall to insert; both endpoint corners must exist
     * @param errorMsg Receives the reason on failure (may be null)
     * @return false (store unchanged) if an endpoint is missing
     */
    bool AddWall(const Wall& wall, std::string* errorMsg = nullptr);

    /**
     * Remove a wall, leaving its corners in place.
     * @return false if the wall does not exist
     */
    bool RemoveWall(const std::string& id);

    // Move both endpoints of a wall by the same world delta
    bool TranslateWall(const std::string& id, float dx, float dy);

    /**
     * Move the end corner along the wall's current direction so the wall
     * measures lengthCm. The start corner stays fixed.
     * @return false for missing/zero-length walls or lengthCm below
     *         MIN_WALL_LENGTH
     */
    bool SetWallLength(const std::string& id, float lengthCm);

    float WallLength(const std::string& id) const;  // 0 if unknown
    std::optional<Point2D> WallCenter(const std::string& id) const;

    // Room cache
    /**
     * Recompute rooms from the current wall graph. Rooms whose corner set
     * matches a cached room keep that room's id, name and texture.
     */
    void UpdateRooms();
    bool SetRoomName(const std::string& id, const std::string& name);
    std::vector<Point2D> RoomPolygon(const Room& room) const;
    float RoomArea(const Room& room) const;          // cm^2
    Point2D RoomCentroid(const Room& room) const;

    // Item operations
    std::string AddItem(const Item& item);  // Returns the generated id
    bool MoveItem(const std::string& id, const Vec3& position);
    bool RotateItem(const std::string& id, const Vec3& rotation);
    bool ScaleItem(const std::string& id, const Vec3& scale);
    bool RemoveItem(const std::string& id);

    // Item selection
    void SelectItem(const std::string& id);
    void DeselectItem(const std::string& id);
    void ClearSelection();
    const std::vector<std::string>& GetSelectedItems() const {
        return m_selectedItems;
    }

    // Id generation (never returns an id already present)
    std::string GenerateCornerId();
    std::string GenerateWallId();
    std::string GenerateRoomId();
    std::string GenerateItemId();

    /**
     * Check that every wall's endpoints exist and every adjacency list
     * matches the walls referencing that corner.
     */
    bool ValidateAdjacency(std::string* errorMsg = nullptr) const;

    // Clear everything back to an empty document
    void Reset();

    // Dirty tracking
    bool dirty = false;
    void MarkDirty();
    void ClearDirty();

    // Edits that would make a wall shorter than this are rejected
    static constexpr float MIN_WALL_LENGTH = 10.0f;

private:
    friend class IOJson;

    // Recreate every adjacency list from the wall map
    void RebuildAdjacency();

    std::map<std::string, Corner> m_corners;
    std::map<std::string, Wall> m_walls;
    std::map<std::string, Room> m_rooms;
    std::map<std::string, Item> m_items;
    std::vector<std::string> m_selectedItems;

    int m_nextCornerId = 0;
    int m_nextWallId = 0;
    int m_nextRoomId = 0;
    int m_nextItemId = 0;
};

} // namespace Planform
