#pragma once

#include "Direction.h"
#include "Sector.h"

#include <array>
#include <optional>

namespace sectorforge {

enum class WallFitStatus : uint8_t {
    Fits = 0,   // heights holds a wall that fills one gap
    SlotFull,   // Edge already holds MAX_WALLS_PER_EDGE walls
    NoGap       // No gap on the edge is large enough
};

// Result of asking where the next wall on an edge should go
struct WallFit {
    WallFitStatus status = WallFitStatus::NoGap;
    // [bottom-left, bottom-right, top-right, top-left], valid when status == Fits
    std::array<float, 4> heights{0.0f, 0.0f, 0.0f, 0.0f};

    bool fits() const { return status == WallFitStatus::Fits; }
    explicit operator bool() const { return fits(); }

    static WallFit fit(const std::array<float, 4>& h) { return WallFit{WallFitStatus::Fits, h}; }
    static WallFit slotFull() { return WallFit{WallFitStatus::SlotFull, {}}; }
    static WallFit noGap() { return WallFit{WallFitStatus::NoGap, {}}; }
};

inline const char* wallFitStatusName(WallFitStatus status) {
    switch (status) {
        case WallFitStatus::Fits:     return "fits";
        case WallFitStatus::SlotFull: return "edge is fully covered";
        case WallFitStatus::NoGap:    return "no gap large enough for a wall";
    }
    return "unknown";
}

namespace GapSolver {

/**
 * Propose the next wall for an edge or diagonal of a sector.
 *
 * - 3 walls already on the edge: SlotFull.
 * - Empty edge: the full floor-to-ceiling quad. When the floor or ceiling
 *   edge is sloped by more than MIN_GAP and preferredY is given, one of two
 *   triangular fills instead: the lower one follows the floor with its top
 *   flat at the higher floor corner, the upper one follows the ceiling with
 *   its bottom flat at that same height.
 * - 1 or 2 walls: gaps below, between and above the walls (sorted by
 *   average bottom) are measured per corner; a gap survives when its larger
 *   corner span reaches MIN_GAP. A corner that does not reach MIN_GAP is
 *   collapsed to a point, giving a triangular wall. The surviving gap whose
 *   midpoint is nearest preferredY wins, otherwise the largest; ties go to
 *   the lowest gap.
 *
 * fallbackFloor / fallbackCeiling stand in for a missing floor or ceiling.
 */
WallFit nextWallPosition(const Sector& sector, Direction dir,
                         float fallbackFloor, float fallbackCeiling,
                         std::optional<float> preferredY = std::nullopt);

// Same policy applied to a diagonal (NW-SE when nwSe is true, NE-SW otherwise)
WallFit nextDiagonalWallPosition(const Sector& sector, bool nwSe,
                                 float fallbackFloor, float fallbackCeiling,
                                 std::optional<float> preferredY = std::nullopt);

} // namespace GapSolver

} // namespace sectorforge
