#include <doctest/doctest.h>
#include <glm/glm.hpp>

#include "walls/WallBoxEmitter.h"

using namespace wallslicer;

static void checkVec3(const glm::vec3& v, float x, float y, float z) {
    CHECK(v.x == doctest::Approx(x).epsilon(0.0001));
    CHECK(v.y == doctest::Approx(y).epsilon(0.0001));
    CHECK(v.z == doctest::Approx(z).epsilon(0.0001));
}

TEST_SUITE("WallPlacement") {
    TEST_CASE("wall along +X keeps local axes") {
        auto placement = WallPlacement::fromEndpoints(glm::vec3(0.0f), glm::vec3(4.0f, 0.0f, 0.0f));
        checkVec3(placement.direction, 1.0f, 0.0f, 0.0f);
        checkVec3(placement.toWorld(glm::vec3(1.0f, 2.0f, 0.0f)), 1.0f, 2.0f, 0.0f);
    }

    TEST_CASE("wall along +Z turns local +X onto +Z") {
        auto placement = WallPlacement::fromEndpoints(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, 3.0f));
        checkVec3(placement.direction, 0.0f, 0.0f, 1.0f);
        checkVec3(placement.toWorld(glm::vec3(2.0f, 0.0f, 0.0f)), 0.0f, 0.0f, 2.0f);
        checkVec3(placement.toWorld(glm::vec3(0.0f, 1.5f, 0.0f)), 0.0f, 1.5f, 0.0f);
    }

    TEST_CASE("reversed wall runs toward -X") {
        auto placement = WallPlacement::fromEndpoints(glm::vec3(5.0f, 0.0f, 1.0f), glm::vec3(1.0f, 0.0f, 1.0f));
        checkVec3(placement.direction, -1.0f, 0.0f, 0.0f);
        checkVec3(placement.toWorld(glm::vec3(1.0f, 0.0f, 0.0f)), 4.0f, 0.0f, 1.0f);
    }

    TEST_CASE("degenerate wall keeps the default direction") {
        auto placement = WallPlacement::fromEndpoints(glm::vec3(2.0f), glm::vec3(2.0f));
        checkVec3(placement.direction, 1.0f, 0.0f, 0.0f);
        checkVec3(placement.origin, 2.0f, 2.0f, 2.0f);
    }
}

TEST_SUITE("WallBoxEmitter") {
    TEST_CASE("slice becomes a placed box") {
        Slice sill{2.0f, 1.0f, 0.0f, 0.9f, SliceRole::Sill};
        auto placement = WallPlacement::fromEndpoints(glm::vec3(10.0f, 0.0f, 5.0f), glm::vec3(15.0f, 0.0f, 5.0f));

        WallBox box = sliceToBox(sill, 0.15f, placement);
        CHECK(box.role == SliceRole::Sill);
        checkVec3(box.localOffset, 2.0f, 0.0f, 0.0f);
        checkVec3(box.size, 1.0f, 0.9f, 0.15f);
        checkVec3(box.worldCenter, 12.5f, 0.45f, 5.0f);
    }

    TEST_CASE("header box starts at its bottom height") {
        Slice header{1.0f, 0.9f, 2.0f, 2.7f, SliceRole::Header};
        auto placement = WallPlacement::fromEndpoints(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, 4.0f));

        WallBox box = sliceToBox(header, 0.1f, placement);
        checkVec3(box.localOffset, 1.0f, 2.0f, 0.0f);
        CHECK(box.size.y == doctest::Approx(0.7f));
        checkVec3(box.worldCenter, 0.0f, 2.35f, 1.45f);
    }

    TEST_CASE("one box per slice in order") {
        std::vector<Slice> slices = {
            {0.0f, 1.0f, 0.0f, 2.7f, SliceRole::Solid},
            {1.0f, 1.0f, 2.1f, 2.7f, SliceRole::Header},
            {2.0f, 3.0f, 0.0f, 2.7f, SliceRole::Solid}
        };
        auto boxes = slicesToBoxes(slices, 0.15f, WallPlacement{});
        REQUIRE(boxes.size() == 3);
        CHECK(boxes[1].role == SliceRole::Header);
        CHECK(boxes[2].localOffset.x == doctest::Approx(2.0f));
    }

    TEST_CASE("box mesh spans the slice and the wall thickness") {
        Slice sill{2.0f, 1.0f, 0.0f, 0.9f, SliceRole::Sill};
        BoxMesh mesh = buildBoxMesh(sliceToBox(sill, 0.15f, WallPlacement{}));

        checkVec3(mesh.vertices[0], 2.0f, 0.0f, -0.075f);
        checkVec3(mesh.vertices[3], 3.0f, 0.9f, -0.075f);
        checkVec3(mesh.vertices[7], 3.0f, 0.9f, 0.075f);

        for (uint32_t index : mesh.indices) {
            CHECK(index < 8);
        }
        CHECK(mesh.uvs[3].x == 1.0f);
        CHECK(mesh.uvs[3].y == 1.0f);
    }
}
