#pragma once

// Turns partitioned wall slices into placed boxes and box meshes.
// Wall-local space: +X along the wall from its start, +Y up, Z across the
// thickness centered on the wall line.

#include "WallTypes.h"
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <array>
#include <cstdint>
#include <vector>

namespace wallslicer {

// Where a wall sits in house space
struct WallPlacement {
    glm::vec3 origin{0.0f};               // World position of the wall start
    glm::vec3 direction{1.0f, 0.0f, 0.0f}; // Unit vector from start to end

    // Rotation taking local +X onto the wall direction (yaw about +Y)
    glm::quat rotation() const;

    glm::vec3 toWorld(const glm::vec3& local) const;

    static WallPlacement fromEndpoints(const glm::vec3& start, const glm::vec3& end);
};

struct WallBox {
    SliceRole role = SliceRole::Solid;
    glm::vec3 localOffset{0.0f};   // Min corner along X/Y, wall line on Z
    glm::vec3 size{0.0f};          // Length, height, thickness
    glm::vec3 worldCenter{0.0f};
    glm::quat worldRotation{1.0f, 0.0f, 0.0f, 0.0f};
};

struct BoxMesh {
    std::array<glm::vec3, 8> vertices;
    std::array<glm::vec2, 8> uvs;
    std::array<uint32_t, 36> indices;
};

WallBox sliceToBox(const Slice& slice, float thickness, const WallPlacement& placement);

std::vector<WallBox> slicesToBoxes(const std::vector<Slice>& slices, float thickness,
                                   const WallPlacement& placement);

// Box spanning [0,length] x [0,height] x [-thickness/2, thickness/2] shifted by
// the box's local offset, front face toward -Z
BoxMesh buildBoxMesh(const WallBox& box);

} // namespace wallslicer
