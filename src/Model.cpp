#include "Model.h"
#include "RoomDetector.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <set>
#include <utility>

namespace Planform {

namespace {

void RemoveId(std::vector<std::string>& ids, const std::string& id) {
    ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
}

void AppendUnique(std::vector<std::string>& ids, const std::string& id) {
    if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
        ids.push_back(id);
    }
}

template <typename Map>
std::string NextFreeId(const Map& entries, const char* prefix, int& counter) {
    char buf[64];
    do {
        snprintf(buf, sizeof(buf), "%s_%d", prefix, counter++);
    } while (entries.count(buf) > 0);
    return buf;
}

} // namespace

Model::Model() {
}

void Model::MarkDirty() {
    dirty = true;
}

void Model::ClearDirty() {
    dirty = false;
}

const Corner* Model::FindCorner(const std::string& id) const {
    auto it = m_corners.find(id);
    return it != m_corners.end() ? &it->second : nullptr;
}

const Wall* Model::FindWall(const std::string& id) const {
    auto it = m_walls.find(id);
    return it != m_walls.end() ? &it->second : nullptr;
}

const Room* Model::FindRoom(const std::string& id) const {
    auto it = m_rooms.find(id);
    return it != m_rooms.end() ? &it->second : nullptr;
}

const Item* Model::FindItem(const std::string& id) const {
    auto it = m_items.find(id);
    return it != m_items.end() ? &it->second : nullptr;
}

// ============================================================================
// Corner operations
// ============================================================================

void Model::AddCorner(const Corner& corner) {
    Corner stored = corner;
    stored.adjacentWalls.clear();

    auto existing = m_corners.find(corner.id);
    if (existing != m_corners.end()) {
        stored.adjacentWalls = existing->second.adjacentWalls;
    } else {
        // Walls may already name this id (e.g. re-adding a removed corner)
        for (const auto& [wallId, wall] : m_walls) {
            if (wall.startCorner == corner.id || wall.endCorner == corner.id) {
                AppendUnique(stored.adjacentWalls, wallId);
            }
        }
    }

    m_corners[stored.id] = std::move(stored);
    MarkDirty();
}

bool Model::MoveCorner(const std::string& id, float x, float y) {
    auto it = m_corners.find(id);
    if (it == m_corners.end()) {
        return false;
    }

    it->second.x = x;
    it->second.y = y;
    MarkDirty();
    return true;
}

bool Model::RemoveCorner(const std::string& id) {
    auto it = m_corners.find(id);
    if (it == m_corners.end()) {
        return false;
    }

    // Copy: RemoveWall prunes this corner's list while we iterate
    const std::vector<std::string> attached = it->second.adjacentWalls;
    for (const auto& wallId : attached) {
        RemoveWall(wallId);
    }

    m_corners.erase(id);
    MarkDirty();
    return true;
}

// ============================================================================
// Wall operations
// ============================================================================

bool Model::AddWall(const Wall& wall, std::string* errorMsg) {
    auto start = m_corners.find(wall.startCorner);
    auto end = m_corners.find(wall.endCorner);

    if (start == m_corners.end() || end == m_corners.end()) {
        const std::string& missing = (start == m_corners.end())
            ? wall.startCorner : wall.endCorner;
        std::string msg = "Wall '" + wall.id +
            "' references missing corner '" + missing + "'";
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "%s", msg.c_str());
        if (errorMsg) {
            *errorMsg = msg;
        }
        return false;
    }

    // Replacing a wall with the same id: drop the old registration first
    if (m_walls.count(wall.id) > 0) {
        RemoveWall(wall.id);
        start = m_corners.find(wall.startCorner);
        end = m_corners.find(wall.endCorner);
    }

    m_walls[wall.id] = wall;
    AppendUnique(start->second.adjacentWalls, wall.id);
    AppendUnique(end->second.adjacentWalls, wall.id);
    MarkDirty();
    return true;
}

bool Model::RemoveWall(const std::string& id) {
    auto it = m_walls.find(id);
    if (it == m_walls.end()) {
        return false;
    }

    const Wall& wall = it->second;
    for (const auto& cornerId : {wall.startCorner, wall.endCorner}) {
        auto corner = m_corners.find(cornerId);
        if (corner != m_corners.end()) {
            RemoveId(corner->second.adjacentWalls, id);
        }
    }

    m_walls.erase(it);
    MarkDirty();
    return true;
}

bool Model::TranslateWall(const std::string& id, float dx, float dy) {
    const Wall* wall = FindWall(id);
    if (!wall) {
        return false;
    }

    auto start = m_corners.find(wall->startCorner);
    auto end = m_corners.find(wall->endCorner);
    if (start == m_corners.end() || end == m_corners.end()) {
        return false;
    }

    start->second.x += dx;
    start->second.y += dy;
    // A wall looping back onto its own corner moves that corner once
    if (end != start) {
        end->second.x += dx;
        end->second.y += dy;
    }
    MarkDirty();
    return true;
}

bool Model::SetWallLength(const std::string& id, float lengthCm) {
    if (!(lengthCm >= MIN_WALL_LENGTH)) {
        return false;
    }

    const Wall* wall = FindWall(id);
    if (!wall) {
        return false;
    }

    const Corner* start = FindCorner(wall->startCorner);
    const Corner* end = FindCorner(wall->endCorner);
    if (!start || !end) {
        return false;
    }

    float dx = end->x - start->x;
    float dy = end->y - start->y;
    float oldLength = std::sqrt(dx * dx + dy * dy);
    if (oldLength == 0.0f) {
        return false;
    }

    float scale = lengthCm / oldLength;
    return MoveCorner(end->id, start->x + dx * scale, start->y + dy * scale);
}

float Model::WallLength(const std::string& id) const {
    const Wall* wall = FindWall(id);
    if (!wall) {
        return 0.0f;
    }

    const Corner* start = FindCorner(wall->startCorner);
    const Corner* end = FindCorner(wall->endCorner);
    if (!start || !end) {
        return 0.0f;
    }
    return Geometry::Distance(start->Position(), end->Position());
}

std::optional<Point2D> Model::WallCenter(const std::string& id) const {
    const Wall* wall = FindWall(id);
    if (!wall) {
        return std::nullopt;
    }

    const Corner* start = FindCorner(wall->startCorner);
    const Corner* end = FindCorner(wall->endCorner);
    if (!start || !end) {
        return std::nullopt;
    }
    return Point2D((start->x + end->x) / 2.0f, (start->y + end->y) / 2.0f);
}

// ============================================================================
// Room cache
// ============================================================================

void Model::UpdateRooms() {
    std::vector<std::vector<std::string>> cycles =
        RoomDetector::FindCycles(*this);

    std::map<std::string, Room> previous;
    previous.swap(m_rooms);

    for (auto& cycle : cycles) {
        std::set<std::string> key(cycle.begin(), cycle.end());

        Room room;
        room.corners = std::move(cycle);

        // Carry over identity and metadata from a cached room on the
        // same corners
        for (auto it = previous.begin(); it != previous.end(); ++it) {
            std::set<std::string> cachedKey(
                it->second.corners.begin(), it->second.corners.end());
            if (cachedKey == key) {
                room.id = it->second.id;
                room.name = it->second.name;
                room.floorTexture = it->second.floorTexture;
                previous.erase(it);
                break;
            }
        }

        if (room.id.empty()) {
            room.id = GenerateRoomId();
        }
        m_rooms[room.id] = room;
    }

    MarkDirty();
}

bool Model::SetRoomName(const std::string& id, const std::string& name) {
    auto it = m_rooms.find(id);
    if (it == m_rooms.end()) {
        return false;
    }

    it->second.name = name;
    MarkDirty();
    return true;
}

std::vector<Point2D> Model::RoomPolygon(const Room& room) const {
    std::vector<Point2D> points;
    points.reserve(room.corners.size());
    for (const auto& cornerId : room.corners) {
        // The cache may be stale; skip corners deleted since it was built
        if (const Corner* corner = FindCorner(cornerId)) {
            points.push_back(corner->Position());
        }
    }
    return points;
}

float Model::RoomArea(const Room& room) const {
    return Geometry::PolygonArea(RoomPolygon(room));
}

Point2D Model::RoomCentroid(const Room& room) const {
    return Geometry::PolygonCentroid(RoomPolygon(room));
}

// ============================================================================
// Item operations
// ============================================================================

std::string Model::AddItem(const Item& item) {
    Item stored = item;
    stored.id = GenerateItemId();
    m_items[stored.id] = stored;
    MarkDirty();
    return stored.id;
}

bool Model::MoveItem(const std::string& id, const Vec3& position) {
    auto it = m_items.find(id);
    if (it == m_items.end()) {
        return false;
    }
    it->second.position = position;
    MarkDirty();
    return true;
}

bool Model::RotateItem(const std::string& id, const Vec3& rotation) {
    auto it = m_items.find(id);
    if (it == m_items.end()) {
        return false;
    }
    it->second.rotation = rotation;
    MarkDirty();
    return true;
}

bool Model::ScaleItem(const std::string& id, const Vec3& scale) {
    auto it = m_items.find(id);
    if (it == m_items.end()) {
        return false;
    }
    it->second.scale = scale;
    MarkDirty();
    return true;
}

bool Model::RemoveItem(const std::string& id) {
    if (m_items.erase(id) == 0) {
        return false;
    }
    RemoveId(m_selectedItems, id);
    MarkDirty();
    return true;
}

void Model::SelectItem(const std::string& id) {
    if (m_items.count(id) > 0) {
        AppendUnique(m_selectedItems, id);
    }
}

void Model::DeselectItem(const std::string& id) {
    RemoveId(m_selectedItems, id);
}

void Model::ClearSelection() {
    m_selectedItems.clear();
}

// ============================================================================
// Ids and bookkeeping
// ============================================================================

std::string Model::GenerateCornerId() {
    return NextFreeId(m_corners, "corner", m_nextCornerId);
}

std::string Model::GenerateWallId() {
    return NextFreeId(m_walls, "wall", m_nextWallId);
}

std::string Model::GenerateRoomId() {
    return NextFreeId(m_rooms, "room", m_nextRoomId);
}

std::string Model::GenerateItemId() {
    return NextFreeId(m_items, "item", m_nextItemId);
}

bool Model::ValidateAdjacency(std::string* errorMsg) const {
    auto fail = [errorMsg](const std::string& msg) {
        if (errorMsg) {
            *errorMsg = msg;
        }
        return false;
    };

    std::map<std::string, std::set<std::string>> expected;
    for (const auto& [wallId, wall] : m_walls) {
        if (!FindCorner(wall.startCorner) || !FindCorner(wall.endCorner)) {
            return fail("Wall '" + wallId + "' has a missing endpoint");
        }
        expected[wall.startCorner].insert(wallId);
        expected[wall.endCorner].insert(wallId);
    }

    for (const auto& [cornerId, corner] : m_corners) {
        std::set<std::string> actual(
            corner.adjacentWalls.begin(), corner.adjacentWalls.end());
        if (actual.size() != corner.adjacentWalls.size()) {
            return fail("Corner '" + cornerId + "' lists a wall twice");
        }
        if (actual != expected[cornerId]) {
            return fail("Corner '" + cornerId + "' adjacency is out of date");
        }
    }

    return true;
}

void Model::RebuildAdjacency() {
    for (auto& [id, corner] : m_corners) {
        corner.adjacentWalls.clear();
    }
    for (const auto& [wallId, wall] : m_walls) {
        AppendUnique(m_corners[wall.startCorner].adjacentWalls, wallId);
        AppendUnique(m_corners[wall.endCorner].adjacentWalls, wallId);
    }
}

void Model::Reset() {
    m_corners.clear();
    m_walls.clear();
    m_rooms.clear();
    m_items.clear();
    m_selectedItems.clear();
    m_nextCornerId = 0;
    m_nextWallId = 0;
    m_nextRoomId = 0;
    m_nextItemId = 0;
    ClearDirty();
}

} // namespace Planform
