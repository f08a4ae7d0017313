#include "HousePlanLoader.h"
#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace wallslicer {

namespace {

glm::vec3 readVec3(const json& j, const char* key) {
    glm::vec3 v(0.0f);
    if (!j.contains(key)) return v;
    const json& o = j[key];
    v.x = o.value("x", 0.0f);
    v.y = o.value("y", 0.0f);
    v.z = o.value("z", 0.0f);
    return v;
}

glm::vec2 readVec2(const json& j, const char* key) {
    glm::vec2 v(0.0f);
    if (!j.contains(key)) return v;
    const json& o = j[key];
    v.x = o.value("x", 0.0f);
    v.y = o.value("y", 0.0f);
    return v;
}

json writeVec3(const glm::vec3& v) {
    return json{{"x", v.x}, {"y", v.y}, {"z", v.z}};
}

json writeVec2(const glm::vec2& v) {
    return json{{"x", v.x}, {"y", v.y}};
}

std::vector<std::string> readStringList(const json& j, const char* key) {
    std::vector<std::string> list;
    if (!j.contains(key)) return list;
    for (const auto& item : j[key]) {
        list.push_back(item.get<std::string>());
    }
    return list;
}

template<typename Enum>
Enum readEnum(const json& j, const char* key, Enum fallback,
              bool (*parse)(const std::string&, Enum&), const char* owner) {
    if (!j.contains(key)) return fallback;
    std::string name = j[key].get<std::string>();
    Enum value = fallback;
    if (!parse(name, value)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "HousePlanLoader: Unknown %s '%s' on %s", key, name.c_str(), owner);
        return fallback;
    }
    return value;
}

WallSegment parseWall(const json& w) {
    WallSegment wall;
    wall.wallId = w.value("wallId", std::string());
    wall.startPoint = readVec3(w, "startPoint");
    wall.endPoint = readVec3(w, "endPoint");
    wall.isExterior = w.value("isExterior", false);
    wall.doorIdsOnWall = readStringList(w, "doorIdsOnWall");
    wall.windowIdsOnWall = readStringList(w, "windowIdsOnWall");
    wall.openingIdsOnWall = readStringList(w, "openingIdsOnWall");
    return wall;
}

RoomData parseRoom(const json& r) {
    RoomData room;
    room.roomId = r.at("roomId").get<std::string>();
    room.roomLabel = r.value("roomLabel", room.roomId);
    room.position = readVec3(r, "position");
    room.dimensions = readVec2(r, "dimensions");
    if (r.contains("walls")) {
        for (const auto& w : r["walls"]) {
            room.walls.push_back(parseWall(w));
        }
    }
    room.connectedRoomIds = readStringList(r, "connectedRoomIds");
    room.notes = r.value("notes", std::string());
    return room;
}

DoorSpec parseDoor(const json& d) {
    DoorSpec door;
    door.doorId = d.at("doorId").get<std::string>();
    door.type = readEnum(d, "type", DoorType::Hinged, &parseDoorType, door.doorId.c_str());
    door.width = d.value("width", door.width);
    door.height = d.value("height", door.height);
    door.position = readVec3(d, "position");
    door.wallId = d.value("wallId", std::string());
    door.swingDirection = readEnum(d, "swingDirection", SwingDirection::None,
                                   &parseSwingDirection, door.doorId.c_str());
    door.connectsRoomA_Id = d.value("connectsRoomA_Id", std::string());
    door.connectsRoomB_Id = d.value("connectsRoomB_Id", std::string());
    return door;
}

WindowSpec parseWindow(const json& w) {
    WindowSpec window;
    window.windowId = w.at("windowId").get<std::string>();
    window.type = readEnum(w, "type", WindowType::Fixed, &parseWindowType, window.windowId.c_str());
    window.width = w.value("width", window.width);
    window.height = w.value("height", window.height);
    window.sillHeight = w.value("sillHeight", window.sillHeight);
    window.position = readVec3(w, "position");
    window.wallId = w.value("wallId", std::string());
    window.isOperable = w.value("isOperable", false);
    return window;
}

OpeningSpec parseOpening(const json& o) {
    OpeningSpec opening;
    opening.openingId = o.at("openingId").get<std::string>();
    opening.type = readEnum(o, "type", OpeningType::CasedOpening, &parseOpeningType,
                            opening.openingId.c_str());
    opening.width = o.value("width", opening.width);
    opening.height = o.value("height", opening.height);
    opening.position = readVec3(o, "position");
    opening.wallId = o.value("wallId", std::string());
    opening.connectsRoomA_Id = o.value("connectsRoomA_Id", std::string());
    opening.connectsRoomB_Id = o.value("connectsRoomB_Id", std::string());
    return opening;
}

HousePlan parsePlan(const json& j) {
    HousePlan plan;
    plan.name = j.value("name", std::string("HousePlan"));
    plan.storyHeight = j.value("storyHeight", plan.storyHeight);
    plan.exteriorWallThickness = j.value("exteriorWallThickness", plan.exteriorWallThickness);
    plan.interiorWallThickness = j.value("interiorWallThickness", plan.interiorWallThickness);

    if (j.contains("rooms")) {
        for (const auto& r : j["rooms"]) plan.rooms.push_back(parseRoom(r));
    }
    if (j.contains("doors")) {
        for (const auto& d : j["doors"]) plan.doors.push_back(parseDoor(d));
    }
    if (j.contains("windows")) {
        for (const auto& w : j["windows"]) plan.windows.push_back(parseWindow(w));
    }
    if (j.contains("openings")) {
        for (const auto& o : j["openings"]) plan.openings.push_back(parseOpening(o));
    }
    return plan;
}

json serializePlan(const HousePlan& plan) {
    json j;
    j["name"] = plan.name;
    j["storyHeight"] = plan.storyHeight;
    j["exteriorWallThickness"] = plan.exteriorWallThickness;
    j["interiorWallThickness"] = plan.interiorWallThickness;

    j["rooms"] = json::array();
    for (const RoomData& room : plan.rooms) {
        json rj;
        rj["roomId"] = room.roomId;
        rj["roomLabel"] = room.roomLabel;
        rj["position"] = writeVec3(room.position);
        rj["dimensions"] = writeVec2(room.dimensions);
        rj["walls"] = json::array();
        for (const WallSegment& wall : room.walls) {
            json wj;
            wj["wallId"] = wall.wallId;
            wj["startPoint"] = writeVec3(wall.startPoint);
            wj["endPoint"] = writeVec3(wall.endPoint);
            wj["isExterior"] = wall.isExterior;
            wj["doorIdsOnWall"] = wall.doorIdsOnWall;
            wj["windowIdsOnWall"] = wall.windowIdsOnWall;
            wj["openingIdsOnWall"] = wall.openingIdsOnWall;
            rj["walls"].push_back(wj);
        }
        rj["connectedRoomIds"] = room.connectedRoomIds;
        rj["notes"] = room.notes;
        j["rooms"].push_back(rj);
    }

    j["doors"] = json::array();
    for (const DoorSpec& door : plan.doors) {
        json dj;
        dj["doorId"] = door.doorId;
        dj["type"] = doorTypeName(door.type);
        dj["width"] = door.width;
        dj["height"] = door.height;
        dj["position"] = writeVec3(door.position);
        dj["wallId"] = door.wallId;
        dj["swingDirection"] = swingDirectionName(door.swingDirection);
        dj["connectsRoomA_Id"] = door.connectsRoomA_Id;
        dj["connectsRoomB_Id"] = door.connectsRoomB_Id;
        j["doors"].push_back(dj);
    }

    j["windows"] = json::array();
    for (const WindowSpec& window : plan.windows) {
        json wj;
        wj["windowId"] = window.windowId;
        wj["type"] = windowTypeName(window.type);
        wj["width"] = window.width;
        wj["height"] = window.height;
        wj["sillHeight"] = window.sillHeight;
        wj["position"] = writeVec3(window.position);
        wj["wallId"] = window.wallId;
        wj["isOperable"] = window.isOperable;
        j["windows"].push_back(wj);
    }

    j["openings"] = json::array();
    for (const OpeningSpec& opening : plan.openings) {
        json oj;
        oj["openingId"] = opening.openingId;
        oj["type"] = openingTypeName(opening.type);
        oj["width"] = opening.width;
        oj["height"] = opening.height;
        oj["position"] = writeVec3(opening.position);
        oj["wallId"] = opening.wallId;
        oj["connectsRoomA_Id"] = opening.connectsRoomA_Id;
        oj["connectsRoomB_Id"] = opening.connectsRoomB_Id;
        j["openings"].push_back(oj);
    }
    return j;
}

} // namespace

bool HousePlanLoader::loadFromJson(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "HousePlanLoader: Failed to open %s", path.c_str());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!loadFromString(buffer.str())) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "HousePlanLoader: Could not load %s", path.c_str());
        return false;
    }

    SDL_Log("HousePlanLoader: Loaded %zu rooms, %zu doors, %zu windows, %zu openings from %s",
            plan.rooms.size(), plan.doors.size(), plan.windows.size(), plan.openings.size(),
            path.c_str());
    return true;
}

bool HousePlanLoader::loadFromString(const std::string& text) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "HousePlanLoader: Invalid file format");
            return false;
        }

        HousePlan parsed = parsePlan(j);
        if (parsed.storyHeight <= 0.0f) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                         "HousePlanLoader: storyHeight must be positive (got %.3f)", parsed.storyHeight);
            return false;
        }

        plan = std::move(parsed);
        loaded = true;
        return true;

    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "HousePlanLoader: JSON parse error: %s", e.what());
        return false;
    }
}

std::string HousePlanLoader::toJsonString(const HousePlan& plan, int indent) {
    return serializePlan(plan).dump(indent);
}

bool HousePlanLoader::saveToJson(const HousePlan& plan, const std::string& path) {
    std::filesystem::path outPath(path);
    if (outPath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(outPath.parent_path(), ec);
        if (ec) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "HousePlanLoader: Could not create %s: %s",
                         outPath.parent_path().string().c_str(), ec.message().c_str());
            return false;
        }
    }

    std::ofstream file(path);
    if (!file) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "HousePlanLoader: Could not write to: %s", path.c_str());
        return false;
    }

    file << toJsonString(plan);
    SDL_Log("HousePlanLoader: Wrote %s", path.c_str());
    return true;
}

} // namespace wallslicer
