#include "IOJson.h"
#include "Model.h"
#include "Limits.h"
#include "platform/Fs.h"
#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <cmath>

using json = nlohmann::json;

namespace Planform {

// Helper: Vec3 as {"x", "y", "z"}
static json Vec3ToJson(const Vec3& v) {
    return {{"x", v.x}, {"y", v.y}, {"z", v.z}};
}

// Helper: Parse Vec3, falling back to the supplied default per axis
static Vec3 Vec3FromJson(const json& j, const Vec3& fallback) {
    Vec3 v = fallback;
    if (j.is_object()) {
        v.x = j.value("x", fallback.x);
        v.y = j.value("y", fallback.y);
        v.z = j.value("z", fallback.z);
    }
    return v;
}

// Helper: Section must be absent or an id-keyed object within limits
static bool CheckSection(
    const json& j, const char* key, size_t limit, std::string& errorMsg
) {
    if (!j.contains(key)) {
        return true;
    }
    if (!j[key].is_object()) {
        errorMsg = std::string("'") + key + "' must be an object";
        return false;
    }
    if (j[key].size() > limit) {
        errorMsg = std::string("Too many entries in '") + key + "'";
        return false;
    }
    return true;
}

std::string IOJson::SaveToString(const Model& model) {
    json j;
    
    j["version"] = DOCUMENT_VERSION;
    
    // Corners (adjacency is written for readers, rebuilt on load)
    j["corners"] = json::object();
    for (const auto& [id, corner] : model.GetCorners()) {
        j["corners"][id] = {
            {"x", corner.x},
            {"y", corner.y},
            {"adjacentWalls", corner.adjacentWalls}
        };
    }
    
    // Walls
    j["walls"] = json::object();
    for (const auto& [id, wall] : model.GetWalls()) {
        json jWall = {
            {"startCorner", wall.startCorner},
            {"endCorner", wall.endCorner},
            {"thickness", wall.thickness},
            {"height", wall.height}
        };
        if (!wall.frontTexture.empty()) {
            jWall["frontTexture"] = wall.frontTexture;
        }
        if (!wall.backTexture.empty()) {
            jWall["backTexture"] = wall.backTexture;
        }
        j["walls"][id] = jWall;
    }
    
    // Rooms (last computed cache)
    j["rooms"] = json::object();
    for (const auto& [id, room] : model.GetRooms()) {
        json jRoom = {{"corners", room.corners}};
        if (!room.name.empty()) {
            jRoom["name"] = room.name;
        }
        if (!room.floorTexture.empty()) {
            jRoom["floorTexture"] = room.floorTexture;
        }
        j["rooms"][id] = jRoom;
    }
    
    // Items
    j["items"] = json::object();
    for (const auto& [id, item] : model.GetItems()) {
        j["items"][id] = {
            {"name", item.name},
            {"modelUrl", item.modelUrl},
            {"position", Vec3ToJson(item.position)},
            {"rotation", Vec3ToJson(item.rotation)},
            {"scale", Vec3ToJson(item.scale)},
            {"metadata", item.metadata}
        };
    }
    
    return j.dump(2);
}

bool IOJson::LoadFromString(
    const std::string& jsonStr,
    Model& outModel,
    std::string& errorMsg
) {
    // Security: Check JSON size before parsing to prevent memory exhaustion
    if (jsonStr.size() > Limits::MAX_DOCUMENT_JSON_SIZE) {
        errorMsg = "Document exceeds maximum size";
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Load: %s",
                     errorMsg.c_str());
        return false;
    }
    
    // Parse into a scratch model; outModel is only replaced on success
    Model loaded;
    
    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            errorMsg = "Document root must be an object";
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Load: %s",
                         errorMsg.c_str());
            return false;
        }
        
        // Version check
        int version = j.value("version", DOCUMENT_VERSION);
        if (version != DOCUMENT_VERSION) {
            errorMsg = "Unsupported document version " +
                std::to_string(version);
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Load: %s",
                         errorMsg.c_str());
            return false;
        }
        
        if (!CheckSection(j, "corners", Limits::MAX_CORNERS, errorMsg) ||
            !CheckSection(j, "walls", Limits::MAX_WALLS, errorMsg) ||
            !CheckSection(j, "rooms", Limits::MAX_ROOMS, errorMsg) ||
            !CheckSection(j, "items", Limits::MAX_ITEMS, errorMsg)) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Load: %s",
                         errorMsg.c_str());
            return false;
        }
        
        // Corners
        if (j.contains("corners")) {
            for (const auto& [id, jCorner] : j["corners"].items()) {
                Corner c;
                c.id = id;
                c.x = jCorner.at("x").get<float>();
                c.y = jCorner.at("y").get<float>();
                if (std::fabs(c.x) > Limits::MAX_COORDINATE ||
                    std::fabs(c.y) > Limits::MAX_COORDINATE) {
                    errorMsg = "Corner '" + id + "' is out of range";
                    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Load: %s",
                                 errorMsg.c_str());
                    return false;
                }
                loaded.m_corners[id] = c;
            }
        }
        
        // Walls (orphans are dropped, not fatal)
        size_t dropped = 0;
        if (j.contains("walls")) {
            for (const auto& [id, jWall] : j["walls"].items()) {
                Wall w;
                w.id = id;
                w.startCorner = jWall.at("startCorner").get<std::string>();
                w.endCorner = jWall.at("endCorner").get<std::string>();
                w.thickness = jWall.value("thickness", 10.0f);
                w.height = jWall.value("height", 250.0f);
                w.frontTexture = jWall.value("frontTexture", "");
                w.backTexture = jWall.value("backTexture", "");
                
                if (!loaded.FindCorner(w.startCorner) ||
                    !loaded.FindCorner(w.endCorner)) {
                    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                                "Load: dropping wall '%s' with missing "
                                "endpoint", id.c_str());
                    ++dropped;
                    continue;
                }
                loaded.m_walls[id] = w;
            }
        }
        
        // Rooms
        if (j.contains("rooms")) {
            for (const auto& [id, jRoom] : j["rooms"].items()) {
                Room r;
                r.id = id;
                r.corners = jRoom.value("corners", std::vector<std::string>());
                r.name = jRoom.value("name", "");
                r.floorTexture = jRoom.value("floorTexture", "");
                loaded.m_rooms[id] = r;
            }
        }
        
        // Items
        if (j.contains("items")) {
            for (const auto& [id, jItem] : j["items"].items()) {
                Item item;
                item.id = id;
                item.name = jItem.value("name", "");
                item.modelUrl = jItem.value("modelUrl", "");
                if (jItem.contains("position")) {
                    item.position = Vec3FromJson(jItem["position"], Vec3());
                }
                if (jItem.contains("rotation")) {
                    item.rotation = Vec3FromJson(jItem["rotation"], Vec3());
                }
                if (jItem.contains("scale")) {
                    item.scale = Vec3FromJson(jItem["scale"], item.scale);
                }
                if (jItem.contains("metadata")) {
                    const json& meta = jItem["metadata"];
                    if (meta.size() > Limits::MAX_ITEM_METADATA) {
                        errorMsg = "Item '" + id + "' has too much metadata";
                        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Load: %s",
                                     errorMsg.c_str());
                        return false;
                    }
                    item.metadata = meta;
                }
                loaded.m_items[id] = item;
            }
        }
        
        // Stored adjacency is not trusted
        loaded.RebuildAdjacency();
        
        if (dropped > 0) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "Load: dropped %zu orphaned wall(s)", dropped);
        }
    } catch (const json::exception& e) {
        errorMsg = std::string("Invalid document: ") + e.what();
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Load: %s",
                     errorMsg.c_str());
        return false;
    }
    
    outModel = std::move(loaded);
    outModel.ClearDirty();
    return true;
}

bool IOJson::SaveToFile(
    const Model& model,
    const std::string& path,
    std::string& errorMsg
) {
    std::string json = SaveToString(model);
    if (!Platform::WriteTextFile(path, json)) {
        errorMsg = "Cannot write " + path;
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Save: %s",
                     errorMsg.c_str());
        return false;
    }
    
    SDL_Log("Saved %s (%zu corners, %zu walls)", path.c_str(),
            model.GetCorners().size(), model.GetWalls().size());
    return true;
}

bool IOJson::LoadFromFile(
    const std::string& path,
    Model& outModel,
    std::string& errorMsg
) {
    // Reject oversized files before reading them into memory
    auto size = Platform::GetFileSize(path);
    if (!size) {
        errorMsg = "Cannot open " + path;
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Load: %s",
                     errorMsg.c_str());
        return false;
    }
    if (*size > Limits::MAX_DOCUMENT_JSON_SIZE) {
        errorMsg = "Document exceeds maximum size";
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Load: %s",
                     errorMsg.c_str());
        return false;
    }
    
    auto content = Platform::ReadTextFile(path);
    if (!content) {
        errorMsg = "Cannot read " + path;
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Load: %s",
                     errorMsg.c_str());
        return false;
    }
    
    if (!LoadFromString(*content, outModel, errorMsg)) {
        return false;
    }
    
    SDL_Log("Loaded %s (%zu corners, %zu walls)", path.c_str(),
            outModel.GetCorners().size(), outModel.GetWalls().size());
    return true;
}

} // namespace Planform
