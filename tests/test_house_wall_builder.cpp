#include <doctest/doctest.h>
#include <glm/glm.hpp>

#include "plan/HouseWallBuilder.h"
#include "plan/HouseWallsWriter.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <utility>

using namespace wallslicer;

namespace {

WallSegment makeWall(const std::string& id, glm::vec3 start, glm::vec3 end, bool exterior) {
    WallSegment wall;
    wall.wallId = id;
    wall.startPoint = start;
    wall.endPoint = end;
    wall.isExterior = exterior;
    return wall;
}

// Two rooms sharing one interior wall, declared from both sides
HousePlan makePlan() {
    HousePlan plan;
    plan.name = "TestHouse";

    RoomData living;
    living.roomId = "Living";
    living.position = glm::vec3(10.0f, 0.0f, 0.0f);
    living.dimensions = glm::vec2(5.0f, 4.0f);

    WallSegment south = makeWall("Living_S", glm::vec3(0.0f), glm::vec3(5.0f, 0.0f, 0.0f), true);
    south.windowIdsOnWall = {"W1"};
    south.doorIdsOnWall = {"D1"};
    living.walls.push_back(south);

    WallSegment east = makeWall("Living_E", glm::vec3(5.0f, 0.0f, 0.0f), glm::vec3(5.0f, 0.0f, 4.0f), false);
    east.openingIdsOnWall = {"O1"};
    living.walls.push_back(east);

    living.walls.push_back(makeWall("Living_Stub", glm::vec3(0.0f, 0.0f, 4.0f),
                                    glm::vec3(0.005f, 0.0f, 4.0f), true));

    WallSegment west = makeWall("Living_W", glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, 4.0f), true);
    west.doorIdsOnWall = {"Missing"};
    living.walls.push_back(west);

    RoomData kitchen;
    kitchen.roomId = "Kitchen";
    kitchen.position = glm::vec3(15.0f, 0.0f, 0.0f);
    WallSegment shared = makeWall("Kitchen_W", glm::vec3(0.0f, 0.0f, 4.0f), glm::vec3(0.0f), false);
    shared.doorIdsOnWall = {"D2"};
    shared.openingIdsOnWall = {"O1"};
    kitchen.walls.push_back(shared);

    plan.rooms = {living, kitchen};

    DoorSpec d1;
    d1.doorId = "D1";
    d1.position = glm::vec3(1.0f, 0.0f, 0.0f);
    d1.width = 0.9f;
    d1.height = 2.0f;
    DoorSpec d2;
    d2.doorId = "D2";
    d2.position = glm::vec3(0.0f, 0.0f, 3.3f);   // Kitchen_W runs toward -Z
    d2.width = 0.8f;
    d2.height = 2.0f;
    plan.doors = {d1, d2};

    WindowSpec w1;
    w1.windowId = "W1";
    w1.position = glm::vec3(3.0f, 0.0f, 0.0f);
    w1.width = 1.0f;
    w1.height = 1.2f;
    w1.sillHeight = 0.9f;
    plan.windows = {w1};

    OpeningSpec o1;
    o1.openingId = "O1";
    o1.position = glm::vec3(15.0f, 0.0f, 1.0f);
    o1.width = 1.2f;
    o1.height = 2.1f;
    plan.openings = {o1};

    return plan;
}

// World Z range covered by one opening of a wall running along Z
std::pair<float, float> openingWorldZ(const BuiltWall& wall, size_t index) {
    const OpeningRequest& o = wall.openings[index];
    float z0 = wall.placement.toWorld(glm::vec3(o.offset, 0.0f, 0.0f)).z;
    float z1 = wall.placement.toWorld(glm::vec3(o.offset + o.width, 0.0f, 0.0f)).z;
    return {std::min(z0, z1), std::max(z0, z1)};
}

size_t findOpening(const BuiltWall& wall, const std::string& id) {
    for (size_t i = 0; i < wall.openingIds.size(); ++i) {
        if (wall.openingIds[i] == id) return i;
    }
    return wall.openingIds.size();
}

WallBuildParams serialParams() {
    WallBuildParams params;
    params.parallel = false;
    return params;
}

} // namespace

TEST_SUITE("HouseWallBuilder") {
    TEST_CASE("walls are sorted into exterior and interior") {
        HousePlan plan = makePlan();
        HouseWalls walls = HouseWallBuilder(plan).build(serialParams());

        REQUIRE(walls.exterior.size() == 2);
        REQUIRE(walls.interior.size() == 1);
        CHECK(walls.skippedWalls == 1);
        CHECK(walls.sharedInteriorWalls == 1);
        CHECK(walls.unresolvedIds == 1);

        CHECK(walls.exterior[0].name == "Wall_Living_0");
        CHECK(walls.exterior[1].name == "Wall_Living_3");
        CHECK(walls.interior[0].name == "Wall_Living_1");
    }

    TEST_CASE("room-relative openings are projected onto the wall") {
        HousePlan plan = makePlan();
        HouseWalls walls = HouseWallBuilder(plan).build(serialParams());

        const BuiltWall& south = walls.exterior[0];
        REQUIRE(south.openings.size() == 2);
        CHECK(south.openingIds[0] == "D1");
        CHECK(south.openings[0].kind == OpeningKind::Door);
        CHECK(south.openings[0].offset == doctest::Approx(1.0f));
        CHECK(south.openings[1].kind == OpeningKind::Window);
        CHECK(south.openings[1].offset == doctest::Approx(3.0f));
        CHECK(south.openings[1].sillHeight == doctest::Approx(0.9f));

        CHECK(south.span().length == doctest::Approx(5.0f));
        CHECK(south.span().height == doctest::Approx(2.7f));
        CHECK(south.span().thickness == doctest::Approx(0.15f));
        CHECK(south.slices().size() == 6);
    }

    TEST_CASE("boxes are placed in house space") {
        HousePlan plan = makePlan();
        HouseWalls walls = HouseWallBuilder(plan).build(serialParams());

        const BuiltWall& south = walls.exterior[0];
        REQUIRE(south.boxes.size() == south.slices().size());
        CHECK(south.boxes[0].worldCenter.x == doctest::Approx(10.5f));
        CHECK(south.boxes[0].worldCenter.y == doctest::Approx(1.35f));
        CHECK(south.boxes[0].worldCenter.z == doctest::Approx(0.0f));

        const BuiltWall& interior = walls.interior[0];
        CHECK(interior.span().thickness == doctest::Approx(0.1f));
        CHECK(interior.boxes[0].worldCenter.x == doctest::Approx(15.0f));
        CHECK(interior.boxes[0].worldCenter.z == doctest::Approx(0.5f));
    }

    TEST_CASE("shared interior wall collects openings from both rooms") {
        HousePlan plan = makePlan();
        HouseWalls walls = HouseWallBuilder(plan).build(serialParams());

        const BuiltWall& wall = walls.interior[0];
        REQUIRE(wall.openingIds.size() == 2);
        CHECK(wall.openingIds[0] == "O1");
        CHECK(wall.openingIds[1] == "D2");
        CHECK(wall.openings[0].kind == OpeningKind::Passthrough);
        CHECK(wall.openings[0].offset == doctest::Approx(1.0f));
        CHECK(wall.openings[1].offset == doctest::Approx(2.5f));

        // Solid, gap, solid, door header, solid
        CHECK(wall.slices().size() == 4);
        CHECK(walls.sliceCount() == 11);
    }

    TEST_CASE("wall with only unresolved ids stays solid") {
        HousePlan plan = makePlan();
        HouseWalls walls = HouseWallBuilder(plan).build(serialParams());

        const BuiltWall& west = walls.exterior[1];
        CHECK(west.openings.empty());
        REQUIRE(west.slices().size() == 1);
        CHECK(west.slices()[0].role == SliceRole::Solid);
        CHECK(west.slices()[0].extent == doctest::Approx(4.0f));
    }

    TEST_CASE("parallel build matches serial build") {
        HousePlan plan = makePlan();
        HouseWalls serial = HouseWallBuilder(plan).build(serialParams());

        WallBuildParams params;
        params.parallel = true;
        params.maxThreads = 4;
        HouseWalls parallel = HouseWallBuilder(plan).build(params);

        REQUIRE(parallel.exterior.size() == serial.exterior.size());
        REQUIRE(parallel.interior.size() == serial.interior.size());
        CHECK(houseWallsToJsonString(plan, parallel) == houseWallsToJsonString(plan, serial));
    }

    TEST_CASE("interior walls can be excluded") {
        HousePlan plan = makePlan();
        WallBuildParams params = serialParams();
        params.includeInterior = false;
        HouseWalls walls = HouseWallBuilder(plan).build(params);

        CHECK(walls.exterior.size() == 2);
        CHECK(walls.interior.empty());
        CHECK(walls.sharedInteriorWalls == 0);
    }

    TEST_CASE("story height override applies to every wall") {
        HousePlan plan = makePlan();
        WallBuildParams params = serialParams();
        params.storyHeightOverride = 3.0f;
        HouseWalls walls = HouseWallBuilder(plan).build(params);

        for (const BuiltWall& wall : walls.exterior) {
            CHECK(wall.span().height == doctest::Approx(3.0f));
        }
    }

    TEST_CASE("zero story height rejects every wall") {
        HousePlan plan = makePlan();
        plan.storyHeight = 0.0f;
        HouseWalls walls = HouseWallBuilder(plan).build(serialParams());

        CHECK(walls.exterior.empty());
        CHECK(walls.interior.empty());
        CHECK(walls.skippedWalls == 4);
    }

    TEST_CASE("shared wall openings do not depend on room order") {
        HousePlan plan = makePlan();
        plan.rooms[1].walls[0].openingIdsOnWall.clear();   // O1 declared by Living only
        HouseWalls livingFirst = HouseWallBuilder(plan).build(serialParams());

        std::swap(plan.rooms[0], plan.rooms[1]);
        HouseWalls kitchenFirst = HouseWallBuilder(plan).build(serialParams());

        REQUIRE(livingFirst.interior.size() == 1);
        REQUIRE(kitchenFirst.interior.size() == 1);
        const BuiltWall& a = livingFirst.interior[0];
        const BuiltWall& b = kitchenFirst.interior[0];
        CHECK(a.placement.direction.z == doctest::Approx(1.0f));
        CHECK(b.placement.direction.z == doctest::Approx(-1.0f));

        for (const char* id : {"D2", "O1"}) {
            CAPTURE(id);
            size_t ia = findOpening(a, id);
            size_t ib = findOpening(b, id);
            REQUIRE(ia < a.openings.size());
            REQUIRE(ib < b.openings.size());
            auto spanA = openingWorldZ(a, ia);
            auto spanB = openingWorldZ(b, ib);
            CHECK(spanA.first == doctest::Approx(spanB.first));
            CHECK(spanA.second == doctest::Approx(spanB.second));
        }

        // Door declared on Kitchen_W from z 3.3 toward z 2.5
        auto door = openingWorldZ(b, findOpening(b, "D2"));
        CHECK(door.first == doctest::Approx(2.5f));
        CHECK(door.second == doctest::Approx(3.3f));
        CHECK(a.slices().size() == b.slices().size());
    }

    TEST_CASE("door and window may share an id") {
        HousePlan plan;
        RoomData room;
        room.roomId = "Study";
        WallSegment wall = makeWall("Study_S", glm::vec3(0.0f), glm::vec3(5.0f, 0.0f, 0.0f), true);
        wall.doorIdsOnWall = {"X"};
        wall.windowIdsOnWall = {"X"};
        room.walls.push_back(wall);
        plan.rooms.push_back(room);

        DoorSpec door;
        door.doorId = "X";
        door.position = glm::vec3(0.5f, 0.0f, 0.0f);
        plan.doors.push_back(door);

        WindowSpec window;
        window.windowId = "X";
        window.position = glm::vec3(3.0f, 0.0f, 0.0f);
        plan.windows.push_back(window);

        HouseWalls walls = HouseWallBuilder(plan).build(serialParams());
        REQUIRE(walls.exterior.size() == 1);
        const BuiltWall& built = walls.exterior[0];
        REQUIRE(built.openings.size() == 2);
        CHECK(built.openings[0].kind == OpeningKind::Door);
        CHECK(built.openings[1].kind == OpeningKind::Window);
        CHECK(built.openings[1].offset == doctest::Approx(3.0f));
        CHECK(walls.unresolvedIds == 0);
    }

    TEST_CASE("segment key ignores direction") {
        glm::vec3 a(1.0f, 0.0f, 2.0f);
        glm::vec3 b(4.0f, 0.0f, 2.0f);
        CHECK(HouseWallBuilder::segmentKey(a, b) == HouseWallBuilder::segmentKey(b, a));

        glm::vec3 c(1.0f, 0.0f, 5.0f);
        CHECK(HouseWallBuilder::segmentKey(a, c) == HouseWallBuilder::segmentKey(c, a));
        CHECK(HouseWallBuilder::segmentKey(a, b) != HouseWallBuilder::segmentKey(a, c));

        // Sub-millimeter differences collapse
        CHECK(HouseWallBuilder::segmentKey(a, b) ==
              HouseWallBuilder::segmentKey(a + glm::vec3(0.0001f, 0.0f, 0.0f), b));
    }
}

TEST_SUITE("HouseWallsWriter") {
    TEST_CASE("output lists walls with their slices") {
        HousePlan plan = makePlan();
        HouseWalls walls = HouseWallBuilder(plan).build(serialParams());

        auto j = nlohmann::json::parse(houseWallsToJsonString(plan, walls));
        CHECK(j["plan"] == "TestHouse");
        CHECK(j["sliceCount"] == 11);
        CHECK(j["skippedWalls"] == 1);
        REQUIRE(j["walls"].size() == 3);

        const auto& south = j["walls"][0];
        CHECK(south["name"] == "Wall_Living_0");
        CHECK(south["exterior"] == true);
        CHECK(south["slices"].size() == 6);
        CHECK(south["openings"][1]["id"] == "W1");
        CHECK(south["openings"][1]["kind"] == "window");
        CHECK(south["slices"][0]["role"] == "solid");
        CHECK(south["slices"][0]["rotation"].size() == 4);

        // Exterior walls first, then interior, each in plan order
        CHECK(j["walls"][1]["name"] == "Wall_Living_3");
        CHECK(j["walls"][2]["name"] == "Wall_Living_1");
        CHECK(j["walls"][2]["exterior"] == false);
    }
}
