#pragma once

// Builds every wall of a house plan: projects each wall's doors, windows and
// cased openings onto the wall axis, partitions the wall around them and
// places the resulting slices as boxes in house space.
//
// Interior walls shared by two rooms are built once. The second room's
// openings on a shared wall are projected onto the wall that was kept, each
// still extending along the direction of the wall that declared it.

#include "HousePlan.h"
#include "core/ParallelFor.h"
#include "walls/WallBoxEmitter.h"
#include "walls/WallOpeningPartitioner.h"
#include <string>
#include <vector>

namespace wallslicer {

struct WallBuildParams {
    float epsilon = WALL_EPSILON;
    float storyHeightOverride = 0.0f;   // <= 0 uses the plan's story height
    bool includeExterior = true;
    bool includeInterior = true;
    bool parallel = true;
    unsigned int maxThreads = 0;        // 0 = hardware concurrency
    ProgressCallback onProgress;
};

struct BuiltWall {
    std::string name;             // Wall_<roomId>_<index within room>
    std::string roomId;
    std::string wallId;
    bool isExterior = false;
    glm::vec3 worldStart{0.0f};
    glm::vec3 worldEnd{0.0f};
    WallPlacement placement;
    std::vector<OpeningRequest> openings;
    std::vector<std::string> openingIds;   // Parallel to openings
    WallPartition partition;
    std::vector<WallBox> boxes;

    const WallSpan& span() const { return partition.span; }
    const std::vector<Slice>& slices() const { return partition.slices; }
};

struct HouseWalls {
    std::vector<BuiltWall> exterior;
    std::vector<BuiltWall> interior;
    float storyHeight = 0.0f;         // Height every wall was built with
    size_t skippedWalls = 0;          // Negligible length or rejected span
    size_t sharedInteriorWalls = 0;   // Duplicates folded into a kept wall
    size_t unresolvedIds = 0;         // Door/window/opening ids not in the plan

    size_t sliceCount() const;
};

class HouseWallBuilder {
public:
    explicit HouseWallBuilder(const HousePlan& plan) : plan(plan) {}

    HouseWalls build(const WallBuildParams& params = WallBuildParams{}) const;

    // Order-independent key of a wall's world endpoints, rounded to millimeters
    static std::string segmentKey(const glm::vec3& start, const glm::vec3& end);

private:
    struct WallJob {
        BuiltWall wall;
        float thickness = 0.0f;
    };

    // Appends the wall's openings to the job, skipping ones it already carries
    void projectOpenings(const RoomData& room, const WallSegment& segment,
                         WallJob& job, size_t& unresolvedIds) const;

    const HousePlan& plan;
};

} // namespace wallslicer
