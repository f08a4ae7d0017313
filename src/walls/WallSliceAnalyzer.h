#pragma once

// Recovers openings from the solid slices of a wall.
//
// Used to check generated walls against their plan: full-height gaps along the
// length are found directly, partial-height gaps are sampled along the wall and
// merged. Each detected opening is classified as door-like or window-like from
// its sill and height.

#include "WallOpeningPartitioner.h"
#include "WallTypes.h"
#include <vector>

namespace wallslicer {

struct DetectedOpening {
    float offset = 0.0f;      // Along the wall
    float sillHeight = 0.0f;  // Above the wall bottom
    float width = 0.0f;
    float height = 0.0f;
    bool isDoorLike = false;
    bool isWindowLike = false;
};

struct AnalyzerThresholds {
    float gapTolerance = 0.01f;           // Minimum horizontal gap
    float verticalGapTolerance = 0.05f;   // Minimum vertical gap at a sample
    float minFragmentHeight = 0.1f;
    float mergeTolerance = 0.1f;
    float minMergedSize = 0.05f;
    float minOpeningSize = 0.1f;

    float doorMinHeight = 1.8f;
    float doorMaxSillHeight = 0.15f;
    float windowMinSillHeight = 0.3f;
    float windowMinHeight = 0.2f;
    float windowMinHeaderClearance = 0.2f;  // Window top to wall top
};

struct WallAnalysis {
    float wallLength = 0.0f;   // Furthest slice end
    std::vector<DetectedOpening> openings;
};

class WallSliceAnalyzer {
public:
    explicit WallSliceAnalyzer(const AnalyzerThresholds& thresholds = AnalyzerThresholds{})
        : thresholds(thresholds) {}

    // wallLength <= 0 measures the length from the slices themselves.
    // Partial-height gaps are sampled every half wall thickness.
    WallAnalysis analyze(const std::vector<Slice>& slices, float storyHeight,
                         float wallThickness, float wallLength = 0.0f) const;

    // Number of openings analyze() should find in a partitioned wall: adjacent
    // covered bands whose voids share a bottom and top read as one opening.
    size_t expectedOpeningCount(const WallPartition& partition,
                                const std::vector<OpeningRequest>& openings) const;

    std::vector<DetectedOpening> mergeFragments(std::vector<DetectedOpening> fragments) const;
    std::vector<DetectedOpening> classify(const std::vector<DetectedOpening>& openings,
                                          float storyHeight) const;

private:
    AnalyzerThresholds thresholds;
};

} // namespace wallslicer
