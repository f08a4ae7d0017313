#pragma once

#include "plan/HouseWallBuilder.h"
#include <string>

namespace wallslicer {

// Rendering options
struct RenderOptions {
    float pixelsPerMeter = 80.0f;
    float padding = 20.0f;

    // Colors
    const char* backgroundColor = "#fdf5e6";  // Old lace
    const char* solidColor = "#b0a08a";
    const char* sillColor = "#8b7d6b";
    const char* headerColor = "#6b5b45";
    const char* outlineColor = "#2c2c2c";     // Dark gray
    const char* doorColor = "#8b4513";        // Saddle brown
    const char* windowColor = "#87ceeb";      // Sky blue
    const char* passthroughColor = "#999999";

    bool showOpenings = true;
    bool showBands = false;        // Debug band boundaries
};

// Escapes &, <, >, " and ' for SVG text and attribute values
std::string escapeXml(const std::string& text);

// Replaces path separators and other characters unsafe in file names with '_'
std::string sanitizeFileName(const std::string& name);

// Write the front elevation of one wall
bool writeWallElevationSVG(
    const std::string& filename,
    const BuiltWall& wall,
    const RenderOptions& options = RenderOptions{}
);

} // namespace wallslicer
