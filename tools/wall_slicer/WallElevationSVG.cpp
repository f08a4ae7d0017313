#include "WallElevationSVG.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iomanip>

namespace wallslicer {

static const char* getSliceColor(SliceRole role, const RenderOptions& options) {
    switch (role) {
        case SliceRole::Sill:   return options.sillColor;
        case SliceRole::Header: return options.headerColor;
        default:                return options.solidColor;
    }
}

static const char* getOpeningColor(OpeningKind kind, const RenderOptions& options) {
    switch (kind) {
        case OpeningKind::Window:      return options.windowColor;
        case OpeningKind::Passthrough: return options.passthroughColor;
        default:                       return options.doorColor;
    }
}

std::string escapeXml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out += c; break;
        }
    }
    return out;
}

std::string sanitizeFileName(const std::string& name) {
    std::string out = name;
    for (char& c : out) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || std::strchr("/\\:*?\"<>|", c)) {
            c = '_';
        }
    }
    if (out.empty() || out == "." || out == "..") {
        out = "wall";
    }
    return out;
}

bool writeWallElevationSVG(
    const std::string& filename,
    const BuiltWall& wall,
    const RenderOptions& options
) {
    std::ofstream file(filename);
    if (!file) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Could not write to: %s", filename.c_str());
        return false;
    }

    const WallSpan& span = wall.span();
    float scale = options.pixelsPerMeter;
    float padding = options.padding;
    float width = span.length * scale + padding * 2;
    float height = span.height * scale + padding * 2 + 20.0f;
    float baseY = padding + 20.0f + span.height * scale;   // Wall bottom in SVG space

    file << std::fixed << std::setprecision(2);
    file << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    file << "<svg xmlns=\"http://www.w3.org/2000/svg\" "
         << "width=\"" << width << "\" height=\"" << height << "\" "
         << "viewBox=\"0 0 " << width << " " << height << "\">\n";

    file << "  <!-- " << escapeXml(wall.name) << " (" << (wall.isExterior ? "exterior" : "interior") << ") -->\n";
    file << "  <!-- Generated by wall_slicer -->\n\n";

    file << "  <rect width=\"100%\" height=\"100%\" fill=\"" << options.backgroundColor << "\"/>\n\n";

    // Solid slices
    file << "  <g id=\"slices\" stroke=\"" << options.outlineColor << "\" stroke-width=\"1\">\n";
    for (const Slice& s : wall.slices()) {
        file << "    <rect x=\"" << (padding + s.start * scale)
             << "\" y=\"" << (baseY - s.topHeight * scale)
             << "\" width=\"" << (s.extent * scale)
             << "\" height=\"" << (s.height() * scale)
             << "\" fill=\"" << getSliceColor(s.role, options) << "\">"
             << "<title>" << sliceRoleName(s.role) << "</title></rect>\n";
    }
    file << "  </g>\n\n";

    // Requested openings, clamped to the wall
    if (options.showOpenings) {
        file << "  <g id=\"openings\" fill=\"none\" stroke-width=\"1.5\" stroke-dasharray=\"4,3\">\n";
        for (size_t i = 0; i < wall.openings.size(); ++i) {
            const OpeningRequest& o = wall.openings[i];
            float x0 = std::clamp(o.offset, 0.0f, span.length);
            float x1 = std::clamp(o.offset + o.width, 0.0f, span.length);
            if (x1 <= x0) continue;

            float bottom = o.kind == OpeningKind::Window ? o.sillHeight : 0.0f;
            float top = std::min(bottom + o.openingHeight, span.height);
            file << "    <rect x=\"" << (padding + x0 * scale)
                 << "\" y=\"" << (baseY - top * scale)
                 << "\" width=\"" << ((x1 - x0) * scale)
                 << "\" height=\"" << ((top - bottom) * scale)
                 << "\" stroke=\"" << getOpeningColor(o.kind, options) << "\">"
                 << "<title>" << escapeXml(wall.openingIds[i]) << "</title></rect>\n";
        }
        file << "  </g>\n\n";
    }

    // Debug band boundaries
    if (options.showBands) {
        file << "  <g id=\"bands\" stroke=\"#d33\" stroke-width=\"0.5\">\n";
        for (const Band& band : wall.partition.bands) {
            float x = padding + band.start * scale;
            file << "    <line x1=\"" << x << "\" y1=\"" << (baseY - span.height * scale)
                 << "\" x2=\"" << x << "\" y2=\"" << baseY << "\"/>\n";
        }
        file << "  </g>\n\n";
    }

    // Ground line
    file << "  <line x1=\"" << padding << "\" y1=\"" << baseY
         << "\" x2=\"" << (padding + span.length * scale) << "\" y2=\"" << baseY
         << "\" stroke=\"" << options.outlineColor << "\" stroke-width=\"2\"/>\n\n";

    // Title
    file << "  <text x=\"" << (width / 2) << "\" y=\"15\" "
         << "font-family=\"sans-serif\" font-size=\"12\" font-weight=\"bold\" "
         << "text-anchor=\"middle\" fill=\"#333\">"
         << escapeXml(wall.name) << " - " << span.length << "m x " << span.height << "m</text>\n";

    file << "</svg>\n";

    SDL_Log("Wrote elevation SVG: %s", filename.c_str());
    return true;
}

} // namespace wallslicer
