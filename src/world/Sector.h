#pragma once

#include "Direction.h"
#include "HorizontalFace.h"
#include "WallStack.h"

#include <array>
#include <optional>

namespace sectorforge {

/**
 * One grid cell of a room: optional floor, optional ceiling and six wall
 * slots (four cardinal edges, two diagonals), each holding up to
 * MAX_WALLS_PER_EDGE stacked walls.
 */
struct Sector {
    std::optional<HorizontalFace> floor;
    std::optional<HorizontalFace> ceiling;
    std::array<WallStack, DIRECTION_COUNT> wallSlots{};

    static Sector empty() { return Sector(); }
    static Sector withFloor(float height, const TextureRef& texture);
    static Sector withFloorAndCeiling(float floorHeight, float ceilingHeight, const TextureRef& texture);

    // True if floor, ceiling or any wall slot is present
    bool hasGeometry() const;

    WallStack& walls(Direction dir) { return wallSlots[static_cast<size_t>(dir)]; }
    const WallStack& walls(Direction dir) const { return wallSlots[static_cast<size_t>(dir)]; }

    // Vertical extent occupied on an edge, nullopt when the slot is empty
    std::optional<float> wallsMaxHeight(Direction dir) const { return walls(dir).maxHeight(); }
    std::optional<float> wallsMinHeight(Direction dir) const { return walls(dir).minHeight(); }

    size_t wallCount() const;

    /**
     * Raise the floor by `amount` and close the resulting step on every
     * cardinal edge. An edge that already has walls gets its lowest wall's
     * bottom moved to the new floor; an empty edge gets a riser spanning old
     * to new floor height, facing out of the sector.
     * @return false if the sector has no floor
     */
    bool extrudeFloor(float amount, const TextureRef& wallTexture);
};

} // namespace sectorforge
