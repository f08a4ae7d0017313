#include "WallBoxEmitter.h"
#include <cmath>

namespace wallslicer {

glm::quat WallPlacement::rotation() const {
    // Local +X maps to (cos a, 0, -sin a) under a yaw of a about +Y
    float yaw = std::atan2(-direction.z, direction.x);
    return glm::angleAxis(yaw, glm::vec3(0.0f, 1.0f, 0.0f));
}

glm::vec3 WallPlacement::toWorld(const glm::vec3& local) const {
    return origin + rotation() * local;
}

WallPlacement WallPlacement::fromEndpoints(const glm::vec3& start, const glm::vec3& end) {
    WallPlacement placement;
    placement.origin = start;

    glm::vec3 delta = end - start;
    delta.y = 0.0f;
    float len = glm::length(delta);
    if (len > 0.0f) {
        placement.direction = delta / len;
    }
    return placement;
}

WallBox sliceToBox(const Slice& slice, float thickness, const WallPlacement& placement) {
    WallBox box;
    box.role = slice.role;
    box.localOffset = glm::vec3(slice.start, slice.bottomHeight, 0.0f);
    box.size = glm::vec3(slice.extent, slice.height(), thickness);

    glm::vec3 localCenter = box.localOffset + glm::vec3(box.size.x * 0.5f, box.size.y * 0.5f, 0.0f);
    box.worldCenter = placement.toWorld(localCenter);
    box.worldRotation = placement.rotation();
    return box;
}

std::vector<WallBox> slicesToBoxes(const std::vector<Slice>& slices, float thickness,
                                   const WallPlacement& placement) {
    std::vector<WallBox> boxes;
    boxes.reserve(slices.size());
    for (const Slice& slice : slices) {
        boxes.push_back(sliceToBox(slice, thickness, placement));
    }
    return boxes;
}

BoxMesh buildBoxMesh(const WallBox& box) {
    const glm::vec3& o = box.localOffset;
    float len = box.size.x;
    float h = box.size.y;
    float halfT = box.size.z * 0.5f;

    BoxMesh mesh;
    mesh.vertices = {
        o + glm::vec3(0.0f, 0.0f, -halfT),
        o + glm::vec3(len,  0.0f, -halfT),
        o + glm::vec3(0.0f, h,    -halfT),
        o + glm::vec3(len,  h,    -halfT),
        o + glm::vec3(0.0f, 0.0f,  halfT),
        o + glm::vec3(len,  0.0f,  halfT),
        o + glm::vec3(0.0f, h,     halfT),
        o + glm::vec3(len,  h,     halfT)
    };

    mesh.uvs = {
        glm::vec2(0.0f, 0.0f), glm::vec2(1.0f, 0.0f),
        glm::vec2(0.0f, 1.0f), glm::vec2(1.0f, 1.0f),
        glm::vec2(0.0f, 0.0f), glm::vec2(1.0f, 0.0f),
        glm::vec2(0.0f, 1.0f), glm::vec2(1.0f, 1.0f)
    };

    mesh.indices = {
        0, 2, 1, 1, 2, 3,   // Front
        4, 5, 6, 5, 7, 6,   // Back
        0, 1, 4, 1, 5, 4,   // Bottom
        2, 6, 3, 3, 6, 7,   // Top
        1, 3, 5, 3, 7, 5,   // Right
        0, 4, 2, 2, 4, 6    // Left
    };
    return mesh;
}

} // namespace wallslicer
