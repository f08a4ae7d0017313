#include "WallOpeningPartitioner.h"
#include <algorithm>
#include <array>
#include <cmath>

namespace wallslicer {

namespace {

struct ClampedOpening {
    size_t index;
    float start;
    float end;
    const OpeningRequest* request;
};

// Band classification order
constexpr std::array<OpeningKind, 3> KIND_PRIORITY = {
    OpeningKind::Window,
    OpeningKind::Door,
    OpeningKind::Passthrough
};

bool isFiniteRequest(const OpeningRequest& o) {
    return std::isfinite(o.offset) && std::isfinite(o.width) &&
           std::isfinite(o.sillHeight) && std::isfinite(o.openingHeight);
}

const ClampedOpening* findCovering(const std::vector<ClampedOpening>& openings, float mid) {
    for (OpeningKind kind : KIND_PRIORITY) {
        for (const ClampedOpening& o : openings) {
            if (o.request->kind != kind) continue;
            if (mid >= o.start && mid < o.end) {
                return &o;
            }
        }
    }
    return nullptr;
}

// Sorted cut markers; a marker within epsilon of the previous kept one is
// folded into it. The first marker is 0 and the last is exactly length.
std::vector<float> buildCutMarkers(const std::vector<ClampedOpening>& openings,
                                   float length, float epsilon) {
    std::vector<float> markers;
    markers.reserve(openings.size() * 2 + 2);
    markers.push_back(0.0f);
    markers.push_back(length);
    for (const ClampedOpening& o : openings) {
        markers.push_back(o.start);
        markers.push_back(o.end);
    }
    std::sort(markers.begin(), markers.end());

    std::vector<float> cuts;
    cuts.reserve(markers.size());
    for (float m : markers) {
        if (cuts.empty() || m - cuts.back() > epsilon) {
            cuts.push_back(m);
        }
    }

    if (cuts.back() != length) {
        if (cuts.size() > 1 && length - cuts.back() <= epsilon) {
            cuts.back() = length;
        } else {
            cuts.push_back(length);
        }
    }
    return cuts;
}

void emitBandSlices(const Band& band, const ClampedOpening* covering,
                    float wallHeight, float epsilon, std::vector<Slice>& out) {
    float start = band.start;
    float extent = band.length();

    if (!covering) {
        out.push_back({start, extent, 0.0f, wallHeight, SliceRole::Solid});
        return;
    }

    const OpeningRequest& o = *covering->request;
    switch (o.kind) {
        case OpeningKind::Window: {
            float sillTop = std::clamp(o.sillHeight, 0.0f, wallHeight);
            float headerBottom = std::clamp(o.sillHeight + o.openingHeight, sillTop, wallHeight);
            if (sillTop > epsilon) {
                out.push_back({start, extent, 0.0f, sillTop, SliceRole::Sill});
            }
            if (wallHeight - headerBottom > epsilon) {
                out.push_back({start, extent, headerBottom, wallHeight, SliceRole::Header});
            }
            break;
        }
        case OpeningKind::Door: {
            // Door voids always reach the floor
            float headerBottom = std::clamp(o.openingHeight, 0.0f, wallHeight);
            if (wallHeight - headerBottom > epsilon) {
                out.push_back({start, extent, headerBottom, wallHeight, SliceRole::Header});
            }
            break;
        }
        case OpeningKind::Passthrough:
            break;
    }
}

} // namespace

bool isValidSpan(const WallSpan& span) {
    return std::isfinite(span.length) && std::isfinite(span.height) &&
           span.length > 0.0f && span.height > 0.0f;
}

std::optional<WallPartition> partitionWall(
    const WallSpan& span,
    const std::vector<OpeningRequest>& openings,
    const PartitionOptions& options)
{
    if (!isValidSpan(span)) {
        return std::nullopt;
    }

    float epsilon = (std::isfinite(options.epsilon) && options.epsilon > 0.0f)
        ? options.epsilon : WALL_EPSILON;
    float length = span.length;

    WallPartition result;
    result.span = span;

    auto report = [&](const OpeningDiagnostic& diag) {
        result.diagnostics.push_back(diag);
        if (options.onDiagnostic) {
            options.onDiagnostic(diag);
        }
    };

    // Clamp to the wall and drop anything too thin to cut
    std::vector<ClampedOpening> clamped;
    clamped.reserve(openings.size());
    for (size_t i = 0; i < openings.size(); ++i) {
        const OpeningRequest& o = openings[i];

        OpeningDiagnostic diag;
        diag.openingIndex = i;
        diag.requestedStart = o.offset;
        diag.requestedEnd = o.offset + o.width;

        if (!isFiniteRequest(o)) {
            diag.type = OpeningDiagnosticType::Dropped;
            report(diag);
            continue;
        }

        diag.clampedStart = std::clamp(diag.requestedStart, 0.0f, length);
        diag.clampedEnd = std::clamp(diag.requestedEnd, 0.0f, length);

        if (diag.clampedEnd - diag.clampedStart <= epsilon) {
            diag.type = OpeningDiagnosticType::Dropped;
            report(diag);
            continue;
        }

        if (diag.requestedStart < 0.0f || diag.requestedEnd > length) {
            diag.type = OpeningDiagnosticType::Clamped;
            report(diag);
        }

        clamped.push_back({i, diag.clampedStart, diag.clampedEnd, &o});
    }

    // A wall shorter than the tolerance has nothing to build
    if (length <= epsilon) {
        return result;
    }

    std::vector<float> cuts = buildCutMarkers(clamped, length, epsilon);

    result.bands.reserve(cuts.size() - 1);
    for (size_t i = 0; i + 1 < cuts.size(); ++i) {
        Band band;
        band.start = cuts[i];
        band.end = cuts[i + 1];
        if (band.length() <= epsilon) continue;

        float mid = band.start + band.length() * 0.5f;
        const ClampedOpening* covering = findCovering(clamped, mid);
        if (covering) {
            band.openingIndex = covering->index;
            band.kind = covering->request->kind;
        }

        result.bands.push_back(band);
        emitBandSlices(band, covering, span.height, epsilon, result.slices);
    }

    return result;
}

std::vector<Slice> partitionSlices(
    const WallSpan& span,
    const std::vector<OpeningRequest>& openings,
    const PartitionOptions& options)
{
    auto partition = partitionWall(span, openings, options);
    if (!partition) {
        return {};
    }
    return std::move(partition->slices);
}

} // namespace wallslicer
