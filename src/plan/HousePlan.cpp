#include "HousePlan.h"
#include <algorithm>
#include <array>

namespace wallslicer {

namespace {

template<typename T>
const T* findById(const std::vector<T>& items, const std::string& id, std::string T::*field) {
    auto it = std::find_if(items.begin(), items.end(),
        [&](const T& item) { return item.*field == id; });
    return it != items.end() ? &*it : nullptr;
}

// Matches a name against every enumerator's printable name
template<typename Enum, size_t N>
bool parseByName(const std::string& name, const std::array<Enum, N>& values,
                 const char* (*nameOf)(Enum), Enum& out) {
    for (Enum value : values) {
        if (name == nameOf(value)) {
            out = value;
            return true;
        }
    }
    return false;
}

} // namespace

const RoomData* HousePlan::findRoom(const std::string& roomId) const {
    return findById(rooms, roomId, &RoomData::roomId);
}

const DoorSpec* HousePlan::findDoor(const std::string& doorId) const {
    return findById(doors, doorId, &DoorSpec::doorId);
}

const WindowSpec* HousePlan::findWindow(const std::string& windowId) const {
    return findById(windows, windowId, &WindowSpec::windowId);
}

const OpeningSpec* HousePlan::findOpening(const std::string& openingId) const {
    return findById(openings, openingId, &OpeningSpec::openingId);
}

size_t HousePlan::wallCount() const {
    size_t count = 0;
    for (const RoomData& room : rooms) {
        count += room.walls.size();
    }
    return count;
}

const char* doorTypeName(DoorType type) {
    switch (type) {
        case DoorType::Hinged:  return "Hinged";
        case DoorType::Sliding: return "Sliding";
        case DoorType::Pocket:  return "Pocket";
        case DoorType::Bifold:  return "Bifold";
        case DoorType::Garage:  return "Garage";
        default:                return "Hinged";
    }
}

const char* swingDirectionName(SwingDirection dir) {
    switch (dir) {
        case SwingDirection::None:         return "None";
        case SwingDirection::InwardNorth:  return "InwardNorth";
        case SwingDirection::InwardSouth:  return "InwardSouth";
        case SwingDirection::InwardEast:   return "InwardEast";
        case SwingDirection::InwardWest:   return "InwardWest";
        case SwingDirection::OutwardNorth: return "OutwardNorth";
        case SwingDirection::OutwardSouth: return "OutwardSouth";
        case SwingDirection::OutwardEast:  return "OutwardEast";
        case SwingDirection::OutwardWest:  return "OutwardWest";
        default:                           return "None";
    }
}

const char* windowTypeName(WindowType type) {
    switch (type) {
        case WindowType::Fixed:      return "Fixed";
        case WindowType::SingleHung: return "SingleHung";
        case WindowType::DoubleHung: return "DoubleHung";
        case WindowType::Casement:   return "Casement";
        case WindowType::Sliding:    return "Sliding";
        case WindowType::Bay:        return "Bay";
        default:                     return "Fixed";
    }
}

const char* openingTypeName(OpeningType type) {
    switch (type) {
        case OpeningType::CasedOpening: return "CasedOpening";
        case OpeningType::Archway:      return "Archway";
        case OpeningType::Passthrough:  return "Passthrough";
        default:                        return "CasedOpening";
    }
}

bool parseDoorType(const std::string& name, DoorType& out) {
    static constexpr std::array<DoorType, 5> values = {
        DoorType::Hinged, DoorType::Sliding, DoorType::Pocket, DoorType::Bifold, DoorType::Garage
    };
    return parseByName(name, values, &doorTypeName, out);
}

bool parseSwingDirection(const std::string& name, SwingDirection& out) {
    static constexpr std::array<SwingDirection, 9> values = {
        SwingDirection::None,
        SwingDirection::InwardNorth, SwingDirection::InwardSouth,
        SwingDirection::InwardEast, SwingDirection::InwardWest,
        SwingDirection::OutwardNorth, SwingDirection::OutwardSouth,
        SwingDirection::OutwardEast, SwingDirection::OutwardWest
    };
    return parseByName(name, values, &swingDirectionName, out);
}

bool parseWindowType(const std::string& name, WindowType& out) {
    static constexpr std::array<WindowType, 6> values = {
        WindowType::Fixed, WindowType::SingleHung, WindowType::DoubleHung,
        WindowType::Casement, WindowType::Sliding, WindowType::Bay
    };
    return parseByName(name, values, &windowTypeName, out);
}

bool parseOpeningType(const std::string& name, OpeningType& out) {
    static constexpr std::array<OpeningType, 3> values = {
        OpeningType::CasedOpening, OpeningType::Archway, OpeningType::Passthrough
    };
    return parseByName(name, values, &openingTypeName, out);
}

} // namespace wallslicer
