#pragma once

// Splits one wall run into solid slices around its door, window and
// passthrough openings.
//
// The wall is treated as a 1-D interval problem: every opening contributes two
// cut markers along the length, consecutive markers form bands, and each band
// is classified once at its midpoint. Windows leave a sill and a header,
// doors leave a header, passthroughs leave nothing.
//
// Classification order at a shared midpoint is Window, Door, Passthrough, then
// input order. Openings of different kinds that overlap inside a single band
// are resolved by the midpoint alone.

#include "WallTypes.h"
#include <functional>
#include <optional>
#include <vector>

namespace wallslicer {

using OpeningDiagnosticCallback = std::function<void(const OpeningDiagnostic&)>;

struct PartitionOptions {
    float epsilon = WALL_EPSILON;
    OpeningDiagnosticCallback onDiagnostic;   // Optional, called in input order
};

struct WallPartition {
    WallSpan span;
    std::vector<Band> bands;            // Left to right, covers [0, length]
    std::vector<Slice> slices;          // Band order, bottom to top within a band
    std::vector<OpeningDiagnostic> diagnostics;
};

// Returns nullopt when the span is structurally invalid (non-positive or
// non-finite length or height). Opening problems never reject the call.
std::optional<WallPartition> partitionWall(
    const WallSpan& span,
    const std::vector<OpeningRequest>& openings,
    const PartitionOptions& options = PartitionOptions{});

// Convenience wrapper returning only the slices; empty for an invalid span
std::vector<Slice> partitionSlices(
    const WallSpan& span,
    const std::vector<OpeningRequest>& openings,
    const PartitionOptions& options = PartitionOptions{});

bool isValidSpan(const WallSpan& span);

} // namespace wallslicer
