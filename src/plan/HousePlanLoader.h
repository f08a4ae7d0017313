#pragma once

// Reads and writes house plans as JSON.
//
// Vectors are objects with "x", "y" (and "z") members. Missing optional fields
// keep the HousePlan defaults; unknown enum names fall back to the first
// enumerator with a warning.

#include "HousePlan.h"
#include <string>

namespace wallslicer {

class HousePlanLoader {
public:
    HousePlanLoader() = default;
    ~HousePlanLoader() = default;

    bool loadFromJson(const std::string& path);
    bool loadFromString(const std::string& text);

    const HousePlan& getPlan() const { return plan; }
    HousePlan& getPlan() { return plan; }

    bool isLoaded() const { return loaded; }

    // Creates missing parent directories
    static bool saveToJson(const HousePlan& plan, const std::string& path);
    static std::string toJsonString(const HousePlan& plan, int indent = 2);

private:
    HousePlan plan;
    bool loaded = false;
};

} // namespace wallslicer
