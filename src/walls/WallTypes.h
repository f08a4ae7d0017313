#pragma once

// Value types shared by the wall partitioner, the box emitter and the analyzer.
// All lengths are in meters, measured along the wall from its start point.

#include <cstdint>
#include <cstddef>
#include <limits>

namespace wallslicer {

// Default tolerance used for clamping, marker de-duplication and slice culling
constexpr float WALL_EPSILON = 0.01f;

// Rectangular footprint of one straight wall run before openings are cut
struct WallSpan {
    float length = 0.0f;
    float height = 0.0f;      // Story height
    float thickness = 0.0f;
};

enum class OpeningKind : uint8_t {
    Door = 0,
    Window = 1,
    Passthrough = 2
};

// A door, window or passthrough anchored along a wall
struct OpeningRequest {
    float offset = 0.0f;         // Wall start to the opening's near edge
    float width = 0.0f;
    float sillHeight = 0.0f;     // 0 for doors and passthroughs
    float openingHeight = 0.0f;
    OpeningKind kind = OpeningKind::Door;
};

enum class SliceRole : uint8_t {
    Solid = 0,
    Sill = 1,
    Header = 2
};

// Solid rectangle of wall left after the openings are cut
struct Slice {
    float start = 0.0f;
    float extent = 0.0f;
    float bottomHeight = 0.0f;
    float topHeight = 0.0f;
    SliceRole role = SliceRole::Solid;

    float end() const { return start + extent; }
    float height() const { return topHeight - bottomHeight; }
};

constexpr size_t NO_OPENING = std::numeric_limits<size_t>::max();

// Interval between two consecutive cut markers, before the height split.
// openingIndex refers to the request list handed to the partitioner.
struct Band {
    float start = 0.0f;
    float end = 0.0f;
    size_t openingIndex = NO_OPENING;
    OpeningKind kind = OpeningKind::Door;   // Only meaningful when covered

    bool isCovered() const { return openingIndex != NO_OPENING; }
    float length() const { return end - start; }
};

enum class OpeningDiagnosticType : uint8_t {
    Clamped,    // Partially or fully outside [0, length]
    Dropped     // Clamped width at or below the tolerance
};

struct OpeningDiagnostic {
    OpeningDiagnosticType type = OpeningDiagnosticType::Clamped;
    size_t openingIndex = 0;
    float requestedStart = 0.0f;
    float requestedEnd = 0.0f;
    float clampedStart = 0.0f;
    float clampedEnd = 0.0f;
};

inline const char* openingKindName(OpeningKind kind) {
    switch (kind) {
        case OpeningKind::Door:        return "door";
        case OpeningKind::Window:      return "window";
        case OpeningKind::Passthrough: return "passthrough";
        default:                       return "door";
    }
}

inline const char* sliceRoleName(SliceRole role) {
    switch (role) {
        case SliceRole::Solid:  return "solid";
        case SliceRole::Sill:   return "sill";
        case SliceRole::Header: return "header";
        default:                return "solid";
    }
}

} // namespace wallslicer
