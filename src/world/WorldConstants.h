#pragma once

#include <cstddef>

// ============================================================================
// SECTOR GRID CONSTANTS
// ============================================================================
// Rooms are laid out on a fixed XZ grid of SECTOR_SIZE cells. Heights are
// edited in "clicks" of CLICK_HEIGHT; the same value is the smallest vertical
// gap on an edge that a new wall may fill.
//
// These are fixed design constants, not per-level configuration.
// ============================================================================

namespace sectorforge {

// Width/depth of one grid cell in world units
constexpr float SECTOR_SIZE = 1024.0f;

// Height granularity (one quarter sector)
constexpr float CLICK_HEIGHT = 256.0f;

// Smallest vertical gap the wall placer treats as fillable
constexpr float MIN_GAP = CLICK_HEIGHT;

// Default ceiling used when a sector has no ceiling face (3 sectors tall)
constexpr float DEFAULT_CEILING_HEIGHT = 3072.0f;

// Hard cap on stacked walls per edge or diagonal
constexpr size_t MAX_WALLS_PER_EDGE = 3;

// Tolerance for height comparisons
constexpr float HEIGHT_EPSILON = 0.001f;

} // namespace sectorforge
