#include "HouseWallsWriter.h"
#include <SDL3/SDL_log.h>
#include <nlohmann/json.hpp>
#include <fstream>

namespace wallslicer {

namespace {

nlohmann::json vec3Json(const glm::vec3& v) {
    return nlohmann::json{{"x", v.x}, {"y", v.y}, {"z", v.z}};
}

nlohmann::json wallJson(const BuiltWall& wall) {
    nlohmann::json wj;
    wj["name"] = wall.name;
    wj["roomId"] = wall.roomId;
    wj["wallId"] = wall.wallId;
    wj["exterior"] = wall.isExterior;
    wj["start"] = vec3Json(wall.worldStart);
    wj["end"] = vec3Json(wall.worldEnd);
    wj["length"] = wall.span().length;
    wj["height"] = wall.span().height;
    wj["thickness"] = wall.span().thickness;

    wj["openings"] = nlohmann::json::array();
    for (size_t i = 0; i < wall.openings.size(); ++i) {
        const OpeningRequest& o = wall.openings[i];
        nlohmann::json oj;
        oj["id"] = wall.openingIds[i];
        oj["kind"] = openingKindName(o.kind);
        oj["offset"] = o.offset;
        oj["width"] = o.width;
        oj["sillHeight"] = o.sillHeight;
        oj["openingHeight"] = o.openingHeight;
        wj["openings"].push_back(oj);
    }

    wj["bands"] = nlohmann::json::array();
    for (const Band& band : wall.partition.bands) {
        nlohmann::json bj;
        bj["start"] = band.start;
        bj["end"] = band.end;
        if (band.isCovered()) {
            bj["opening"] = wall.openingIds[band.openingIndex];
            bj["kind"] = openingKindName(band.kind);
        }
        wj["bands"].push_back(bj);
    }

    wj["slices"] = nlohmann::json::array();
    for (size_t i = 0; i < wall.slices().size(); ++i) {
        const Slice& s = wall.slices()[i];
        const WallBox& box = wall.boxes[i];
        nlohmann::json sj;
        sj["role"] = sliceRoleName(s.role);
        sj["start"] = s.start;
        sj["extent"] = s.extent;
        sj["bottom"] = s.bottomHeight;
        sj["top"] = s.topHeight;
        sj["center"] = vec3Json(box.worldCenter);
        sj["size"] = vec3Json(box.size);
        sj["rotation"] = {box.worldRotation.w, box.worldRotation.x,
                          box.worldRotation.y, box.worldRotation.z};
        wj["slices"].push_back(sj);
    }
    return wj;
}

} // namespace

std::string houseWallsToJsonString(const HousePlan& plan, const HouseWalls& walls, int indent) {
    nlohmann::json j;
    j["plan"] = plan.name;
    j["storyHeight"] = walls.storyHeight;
    j["walls"] = nlohmann::json::array();
    for (const BuiltWall& wall : walls.exterior) j["walls"].push_back(wallJson(wall));
    for (const BuiltWall& wall : walls.interior) j["walls"].push_back(wallJson(wall));
    j["sliceCount"] = walls.sliceCount();
    j["skippedWalls"] = walls.skippedWalls;
    j["sharedInteriorWalls"] = walls.sharedInteriorWalls;
    return j.dump(indent);
}

bool writeHouseWallsJson(const std::string& filename, const HousePlan& plan, const HouseWalls& walls) {
    std::ofstream file(filename);
    if (!file) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Could not write to: %s", filename.c_str());
        return false;
    }

    file << houseWallsToJsonString(plan, walls);
    SDL_Log("Wrote wall slices: %s (%zu walls)", filename.c_str(),
            walls.exterior.size() + walls.interior.size());
    return true;
}

} // namespace wallslicer
