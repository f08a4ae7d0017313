#include "HouseWallBuilder.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <unordered_map>

namespace wallslicer {

namespace {

// Walls at or below this length are not built
constexpr float MIN_WALL_LENGTH = 0.01f;

// Ids are unique per kind only; a door and a window may share one
bool hasOpening(const BuiltWall& wall, OpeningKind kind, const std::string& id) {
    for (size_t i = 0; i < wall.openings.size(); ++i) {
        if (wall.openings[i].kind == kind && wall.openingIds[i] == id) {
            return true;
        }
    }
    return false;
}

float alongWall(const glm::vec3& point, const BuiltWall& wall) {
    return glm::dot(point - wall.worldStart, wall.placement.direction);
}

// The opening runs from its anchor along the declaring wall's direction, so
// on a shared wall kept in the opposite direction the anchor is its far edge.
void projectSpan(const glm::vec3& anchor, float width, const glm::vec3& declaredDirection,
                 const BuiltWall& wall, OpeningRequest& request) {
    float along = alongWall(anchor, wall);
    bool reversed = glm::dot(declaredDirection, wall.placement.direction) < 0.0f;
    request.offset = reversed ? along - width : along;
    request.width = width;
}

void logDiagnostics(const BuiltWall& wall) {
    for (const OpeningDiagnostic& diag : wall.partition.diagnostics) {
        const std::string& id = wall.openingIds[diag.openingIndex];
        if (diag.type == OpeningDiagnosticType::Dropped) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "HouseWallBuilder: %s: dropped %s '%s' at [%.3f, %.3f] (outside wall or too narrow)",
                        wall.name.c_str(), openingKindName(wall.openings[diag.openingIndex].kind),
                        id.c_str(), diag.requestedStart, diag.requestedEnd);
        } else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "HouseWallBuilder: %s: clamped %s '%s' from [%.3f, %.3f] to [%.3f, %.3f]",
                        wall.name.c_str(), openingKindName(wall.openings[diag.openingIndex].kind),
                        id.c_str(), diag.requestedStart, diag.requestedEnd,
                        diag.clampedStart, diag.clampedEnd);
        }
    }
}

} // namespace

size_t HouseWalls::sliceCount() const {
    size_t count = 0;
    for (const BuiltWall& wall : exterior) count += wall.slices().size();
    for (const BuiltWall& wall : interior) count += wall.slices().size();
    return count;
}

std::string HouseWallBuilder::segmentKey(const glm::vec3& start, const glm::vec3& end) {
    glm::vec3 a = start;
    glm::vec3 b = end;
    if (a.x > b.x || (std::abs(a.x - b.x) < 1e-5f && a.z > b.z)) {
        std::swap(a, b);
    }

    char key[128];
    std::snprintf(key, sizeof(key), "%.3f_%.3f_%.3f-%.3f_%.3f_%.3f",
                  a.x, a.y, a.z, b.x, b.y, b.z);
    return key;
}

void HouseWallBuilder::projectOpenings(const RoomData& room, const WallSegment& segment,
                                       WallJob& job, size_t& unresolvedIds) const {
    BuiltWall& wall = job.wall;
    glm::vec3 declaredDirection = WallPlacement::fromEndpoints(segment.startPoint, segment.endPoint).direction;

    auto add = [&](const std::string& id, const OpeningRequest& request) {
        wall.openings.push_back(request);
        wall.openingIds.push_back(id);
    };

    auto unresolved = [&](const char* what, const std::string& id) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "HouseWallBuilder: %s references unknown %s '%s'",
                    segment.wallId.c_str(), what, id.c_str());
        ++unresolvedIds;
    };

    for (const std::string& id : segment.doorIdsOnWall) {
        if (hasOpening(wall, OpeningKind::Door, id)) continue;
        const DoorSpec* door = plan.findDoor(id);
        if (!door) {
            unresolved("door", id);
            continue;
        }
        OpeningRequest request;
        projectSpan(room.position + door->position, door->width, declaredDirection, wall, request);
        request.sillHeight = 0.0f;
        request.openingHeight = door->height;
        request.kind = OpeningKind::Door;
        add(id, request);
    }

    for (const std::string& id : segment.windowIdsOnWall) {
        if (hasOpening(wall, OpeningKind::Window, id)) continue;
        const WindowSpec* window = plan.findWindow(id);
        if (!window) {
            unresolved("window", id);
            continue;
        }
        OpeningRequest request;
        projectSpan(room.position + window->position, window->width, declaredDirection, wall, request);
        request.sillHeight = window->sillHeight;
        request.openingHeight = window->height;
        request.kind = OpeningKind::Window;
        add(id, request);
    }

    // Cased openings are positioned in house space
    for (const std::string& id : segment.openingIdsOnWall) {
        if (hasOpening(wall, OpeningKind::Passthrough, id)) continue;
        const OpeningSpec* opening = plan.findOpening(id);
        if (!opening) {
            unresolved("opening", id);
            continue;
        }
        OpeningRequest request;
        projectSpan(opening->position, opening->width, declaredDirection, wall, request);
        request.sillHeight = 0.0f;
        request.openingHeight = opening->height;
        request.kind = OpeningKind::Passthrough;
        add(id, request);
    }
}

HouseWalls HouseWallBuilder::build(const WallBuildParams& params) const {
    HouseWalls result;

    float storyHeight = params.storyHeightOverride > 0.0f ? params.storyHeightOverride : plan.storyHeight;
    result.storyHeight = storyHeight;

    // Gather walls sequentially; shared interior walls depend on plan order
    std::vector<WallJob> jobs;
    std::unordered_map<std::string, size_t> interiorByKey;

    for (const RoomData& room : plan.rooms) {
        for (size_t w = 0; w < room.walls.size(); ++w) {
            const WallSegment& segment = room.walls[w];
            if (segment.isExterior ? !params.includeExterior : !params.includeInterior) {
                continue;
            }

            glm::vec3 worldStart = room.position + segment.startPoint;
            glm::vec3 worldEnd = room.position + segment.endPoint;
            if (glm::length(worldEnd - worldStart) <= MIN_WALL_LENGTH) {
                SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "HouseWallBuilder: Skipping negligible wall %s",
                             segment.wallId.c_str());
                ++result.skippedWalls;
                continue;
            }

            if (!segment.isExterior) {
                std::string key = segmentKey(worldStart, worldEnd);
                auto it = interiorByKey.find(key);
                if (it != interiorByKey.end()) {
                    projectOpenings(room, segment, jobs[it->second], result.unresolvedIds);
                    ++result.sharedInteriorWalls;
                    continue;
                }
                interiorByKey.emplace(key, jobs.size());
            }

            WallJob job;
            job.wall.name = "Wall_" + room.roomId + "_" + std::to_string(w);
            job.wall.roomId = room.roomId;
            job.wall.wallId = segment.wallId;
            job.wall.isExterior = segment.isExterior;
            job.wall.worldStart = worldStart;
            job.wall.worldEnd = worldEnd;
            job.wall.placement = WallPlacement::fromEndpoints(worldStart, worldEnd);
            job.thickness = segment.isExterior ? plan.exteriorWallThickness : plan.interiorWallThickness;
            projectOpenings(room, segment, job, result.unresolvedIds);
            jobs.push_back(std::move(job));
        }
    }

    // Partition independently; each worker only touches its own job
    std::vector<char> built(jobs.size(), 0);
    PartitionOptions options;
    options.epsilon = params.epsilon;

    auto partitionJob = [&](size_t i) {
        BuiltWall& wall = jobs[i].wall;
        WallSpan span;
        span.length = glm::length(wall.worldEnd - wall.worldStart);
        span.height = storyHeight;
        span.thickness = jobs[i].thickness;

        auto partition = partitionWall(span, wall.openings, options);
        if (!partition) return;

        wall.partition = std::move(*partition);
        wall.boxes = slicesToBoxes(wall.partition.slices, span.thickness, wall.placement);
        built[i] = 1;
    };

    ProgressTracker tracker(jobs.size(), params.onProgress, "Partitioning walls");
    parallel_for(jobs.size(), partitionJob, params.parallel ? params.maxThreads : 1u, &tracker);

    for (size_t i = 0; i < jobs.size(); ++i) {
        BuiltWall& wall = jobs[i].wall;
        if (!built[i]) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                         "HouseWallBuilder: %s rejected (story height %.3f)", wall.name.c_str(), storyHeight);
            ++result.skippedWalls;
            continue;
        }
        logDiagnostics(wall);
        if (wall.isExterior) {
            result.exterior.push_back(std::move(wall));
        } else {
            result.interior.push_back(std::move(wall));
        }
    }

    SDL_Log("HouseWallBuilder: Built %zu exterior and %zu interior walls (%zu slices, %zu skipped, %zu shared)",
            result.exterior.size(), result.interior.size(), result.sliceCount(),
            result.skippedWalls, result.sharedInteriorWalls);
    return result;
}

} // namespace wallslicer
