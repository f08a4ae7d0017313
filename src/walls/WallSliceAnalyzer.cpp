#include "WallSliceAnalyzer.h"
#include <algorithm>
#include <cmath>

namespace wallslicer {

namespace {

struct VoidProfile {
    float bottom = 0.0f;
    float top = 0.0f;
};

// Vertical extent left open by a request, after the partitioner's clamping
VoidProfile voidProfile(const OpeningRequest& o, float wallHeight) {
    VoidProfile p;
    switch (o.kind) {
        case OpeningKind::Window:
            p.bottom = std::clamp(o.sillHeight, 0.0f, wallHeight);
            p.top = std::clamp(o.sillHeight + o.openingHeight, p.bottom, wallHeight);
            break;
        case OpeningKind::Door:
            p.top = std::clamp(o.openingHeight, 0.0f, wallHeight);
            break;
        case OpeningKind::Passthrough:
            p.top = wallHeight;
            break;
    }
    // Sills and headers thinner than the tolerance are never built
    if (p.bottom <= WALL_EPSILON) p.bottom = 0.0f;
    if (wallHeight - p.top <= WALL_EPSILON) p.top = wallHeight;
    return p;
}

} // namespace

WallAnalysis WallSliceAnalyzer::analyze(const std::vector<Slice>& slices, float storyHeight,
                                        float wallThickness, float wallLength) const {
    WallAnalysis result;

    std::vector<Slice> sorted = slices;
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const Slice& a, const Slice& b) { return a.start < b.start; });

    float measured = 0.0f;
    for (const Slice& s : sorted) {
        measured = std::max(measured, s.end());
    }
    result.wallLength = wallLength > 0.0f ? wallLength : measured;
    if (result.wallLength <= 0.0f) {
        return result;
    }

    std::vector<DetectedOpening> detected;

    // Full-height gaps between slices along the length
    float xTracker = 0.0f;
    for (const Slice& s : sorted) {
        if (s.start > xTracker + thresholds.gapTolerance) {
            detected.push_back({xTracker, 0.0f, s.start - xTracker, storyHeight, false, false});
        }
        xTracker = std::max(xTracker, s.end());
    }
    if (xTracker < result.wallLength - thresholds.gapTolerance) {
        detected.push_back({xTracker, 0.0f, result.wallLength - xTracker, storyHeight, false, false});
    }

    // Partial-height gaps, sampled at half the wall thickness
    float step = wallThickness > 0.0f ? wallThickness * 0.5f : 0.1f;
    if (step <= 0.001f) step = 0.1f;

    std::vector<DetectedOpening> fragments;
    std::vector<const Slice*> covering;
    for (int i = 0; ; ++i) {
        float x = step * (static_cast<float>(i) + 0.5f);
        if (x >= result.wallLength) break;

        covering.clear();
        for (const Slice& s : sorted) {
            if (x >= s.start && x < s.end()) {
                covering.push_back(&s);
            }
        }
        if (covering.empty()) continue;   // Already found as a full-height gap

        std::stable_sort(covering.begin(), covering.end(),
            [](const Slice* a, const Slice* b) { return a->bottomHeight < b->bottomHeight; });

        float left = x - step * 0.5f;
        float yTracker = 0.0f;
        for (const Slice* s : covering) {
            if (s->bottomHeight > yTracker + thresholds.verticalGapTolerance) {
                float h = s->bottomHeight - yTracker;
                if (h > thresholds.minFragmentHeight) {
                    fragments.push_back({left, yTracker, step, h, false, false});
                }
            }
            yTracker = std::max(yTracker, s->topHeight);
        }
        if (storyHeight > yTracker + thresholds.verticalGapTolerance) {
            float h = storyHeight - yTracker;
            if (h > thresholds.minFragmentHeight) {
                fragments.push_back({left, yTracker, step, h, false, false});
            }
        }
    }

    std::vector<DetectedOpening> merged = mergeFragments(std::move(fragments));
    detected.insert(detected.end(), merged.begin(), merged.end());

    result.openings = classify(detected, storyHeight);
    std::stable_sort(result.openings.begin(), result.openings.end(),
        [](const DetectedOpening& a, const DetectedOpening& b) { return a.offset < b.offset; });
    return result;
}

size_t WallSliceAnalyzer::expectedOpeningCount(const WallPartition& partition,
                                               const std::vector<OpeningRequest>& openings) const {
    const float wallHeight = partition.span.height;
    const float tol = thresholds.mergeTolerance;

    size_t count = 0;
    bool inRun = false;
    VoidProfile current;
    for (const Band& band : partition.bands) {
        if (!band.isCovered() || band.openingIndex >= openings.size()) {
            inRun = false;
            continue;
        }

        VoidProfile next = voidProfile(openings[band.openingIndex], wallHeight);
        bool continues = inRun &&
                         std::abs(next.bottom - current.bottom) < tol &&
                         std::abs(next.top - current.top) < tol;
        if (!continues) {
            ++count;
        }
        current = next;
        inRun = true;
    }
    return count;
}

std::vector<DetectedOpening> WallSliceAnalyzer::mergeFragments(std::vector<DetectedOpening> fragments) const {
    if (fragments.size() < 2) return fragments;

    std::stable_sort(fragments.begin(), fragments.end(),
        [](const DetectedOpening& a, const DetectedOpening& b) {
            if (a.offset != b.offset) return a.offset < b.offset;
            return a.sillHeight < b.sillHeight;
        });

    const float tol = thresholds.mergeTolerance;
    std::vector<DetectedOpening> merged;
    DetectedOpening current = fragments[0];

    for (size_t i = 1; i < fragments.size(); ++i) {
        const DetectedOpening& next = fragments[i];

        bool xContiguous = std::abs(current.offset + current.width - next.offset) < tol;
        bool yAligned = std::abs(current.sillHeight - next.sillHeight) < tol &&
                        std::abs(current.height - next.height) < tol;
        if (xContiguous && yAligned) {
            float left = std::min(current.offset, next.offset);
            current.width = next.offset + next.width - left;
            current.offset = left;
            continue;
        }

        bool yContiguous = std::abs(current.sillHeight + current.height - next.sillHeight) < tol;
        bool xAligned = std::abs(current.offset - next.offset) < tol &&
                        std::abs(current.width - next.width) < tol;
        if (yContiguous && xAligned) {
            float bottom = std::min(current.sillHeight, next.sillHeight);
            current.height = next.sillHeight + next.height - bottom;
            current.sillHeight = bottom;
            continue;
        }

        merged.push_back(current);
        current = next;
    }
    merged.push_back(current);

    merged.erase(std::remove_if(merged.begin(), merged.end(),
        [this](const DetectedOpening& o) {
            return o.width < thresholds.minMergedSize || o.height < thresholds.minMergedSize;
        }), merged.end());
    return merged;
}

std::vector<DetectedOpening> WallSliceAnalyzer::classify(const std::vector<DetectedOpening>& openings,
                                                         float storyHeight) const {
    std::vector<DetectedOpening> classified;

    for (DetectedOpening o : openings) {
        float top = o.sillHeight + o.height;

        o.isDoorLike = o.sillHeight <= thresholds.doorMaxSillHeight &&
                       o.height >= thresholds.doorMinHeight;
        o.isWindowLike = !o.isDoorLike &&
                         o.sillHeight >= thresholds.windowMinSillHeight &&
                         top < storyHeight - thresholds.windowMinHeaderClearance &&
                         o.height >= thresholds.windowMinHeight;

        // Floor-to-ceiling gaps are passages even when short
        bool fullHeight = std::abs(o.height - storyHeight) < thresholds.mergeTolerance &&
                          o.sillHeight <= thresholds.doorMaxSillHeight;
        if (fullHeight && !o.isWindowLike) {
            o.isDoorLike = true;
        }

        if ((o.isDoorLike || o.isWindowLike) &&
            o.width > thresholds.minOpeningSize && o.height > thresholds.minOpeningSize) {
            classified.push_back(o);
        }
    }
    return classified;
}

} // namespace wallslicer
