#pragma once

// Serializes built walls (spans, bands, slices and placed boxes) to JSON for
// the geometry emitter on the engine side. Exterior walls come first, then
// interior walls, each in plan order.

#include "HouseWallBuilder.h"
#include <string>

namespace wallslicer {

std::string houseWallsToJsonString(const HousePlan& plan, const HouseWalls& walls, int indent = 2);

bool writeHouseWallsJson(const std::string& filename, const HousePlan& plan, const HouseWalls& walls);

} // namespace wallslicer
