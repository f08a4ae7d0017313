#pragma once

// House plan: rooms with their wall runs, plus the doors, windows and cased
// openings cut into those walls. Positions are in meters; Y is up and rooms
// lie on the XZ plane.

#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace wallslicer {

enum class DoorType : uint8_t {
    Hinged,
    Sliding,
    Pocket,
    Bifold,
    Garage
};

enum class SwingDirection : uint8_t {
    None,
    InwardNorth,
    InwardSouth,
    InwardEast,
    InwardWest,
    OutwardNorth,
    OutwardSouth,
    OutwardEast,
    OutwardWest
};

enum class WindowType : uint8_t {
    Fixed,
    SingleHung,
    DoubleHung,
    Casement,
    Sliding,
    Bay
};

enum class OpeningType : uint8_t {
    CasedOpening,
    Archway,
    Passthrough
};

// One straight wall run, endpoints relative to the owning room
struct WallSegment {
    std::string wallId;
    glm::vec3 startPoint{0.0f};
    glm::vec3 endPoint{0.0f};
    bool isExterior = false;
    std::vector<std::string> doorIdsOnWall;
    std::vector<std::string> windowIdsOnWall;
    std::vector<std::string> openingIdsOnWall;

    float length() const { return glm::length(endPoint - startPoint); }
};

struct RoomData {
    std::string roomId;
    std::string roomLabel;
    glm::vec3 position{0.0f};     // SW corner in house space
    glm::vec2 dimensions{0.0f};   // Width (X), depth (Z)
    std::vector<WallSegment> walls;
    std::vector<std::string> connectedRoomIds;
    std::string notes;
};

// Position is relative to the room owning the wall
struct DoorSpec {
    std::string doorId;
    DoorType type = DoorType::Hinged;
    float width = 0.9f;
    float height = 2.03f;
    glm::vec3 position{0.0f};
    std::string wallId;
    SwingDirection swingDirection = SwingDirection::None;
    std::string connectsRoomA_Id;
    std::string connectsRoomB_Id;
};

// Position is relative to the room owning the wall
struct WindowSpec {
    std::string windowId;
    WindowType type = WindowType::Fixed;
    float width = 0.9f;
    float height = 1.2f;
    float sillHeight = 0.9f;
    glm::vec3 position{0.0f};
    std::string wallId;
    bool isOperable = false;
};

// Position is in house space
struct OpeningSpec {
    std::string openingId;
    OpeningType type = OpeningType::CasedOpening;
    float width = 1.2f;
    float height = 2.03f;
    glm::vec3 position{0.0f};
    std::string wallId;
    std::string connectsRoomA_Id;
    std::string connectsRoomB_Id;
};

struct HousePlan {
    std::string name;
    float storyHeight = 2.7f;
    float exteriorWallThickness = 0.15f;
    float interiorWallThickness = 0.1f;

    std::vector<RoomData> rooms;
    std::vector<DoorSpec> doors;
    std::vector<WindowSpec> windows;
    std::vector<OpeningSpec> openings;

    // Lookups return nullptr when the id is unknown
    const RoomData* findRoom(const std::string& roomId) const;
    const DoorSpec* findDoor(const std::string& doorId) const;
    const WindowSpec* findWindow(const std::string& windowId) const;
    const OpeningSpec* findOpening(const std::string& openingId) const;

    size_t wallCount() const;
};

const char* doorTypeName(DoorType type);
const char* swingDirectionName(SwingDirection dir);
const char* windowTypeName(WindowType type);
const char* openingTypeName(OpeningType type);

// Return false and leave the output untouched for unknown names
bool parseDoorType(const std::string& name, DoorType& out);
bool parseSwingDirection(const std::string& name, SwingDirection& out);
bool parseWindowType(const std::string& name, WindowType& out);
bool parseOpeningType(const std::string& name, OpeningType& out);

} // namespace wallslicer
