#include "Sector.h"

#include <algorithm>

namespace sectorforge {

Sector Sector::withFloor(float height, const TextureRef& texture) {
    Sector sector;
    sector.floor = HorizontalFace::flat(height, texture);
    return sector;
}

Sector Sector::withFloorAndCeiling(float floorHeight, float ceilingHeight, const TextureRef& texture) {
    Sector sector;
    sector.floor = HorizontalFace::flat(floorHeight, texture);
    sector.ceiling = HorizontalFace::flat(ceilingHeight, texture);
    return sector;
}

bool Sector::hasGeometry() const {
    if (floor || ceiling) {
        return true;
    }
    return std::any_of(wallSlots.begin(), wallSlots.end(),
                       [](const WallStack& stack) { return !stack.empty(); });
}

size_t Sector::wallCount() const {
    size_t total = 0;
    for (const auto& stack : wallSlots) {
        total += stack.size();
    }
    return total;
}

bool Sector::extrudeFloor(float amount, const TextureRef& wallTexture) {
    if (!floor) {
        return false;
    }

    HorizontalFace raised = *floor;
    raised.raise(amount);

    for (Direction dir : CARDINAL_DIRECTIONS) {
        auto [oldLeft, oldRight] = floor->edgeHeights(dir);
        auto [newLeft, newRight] = raised.edgeHeights(dir);
        WallStack& stack = walls(dir);

        // Walls whose top is at or below the raised floor on both corners
        // would be buried; drop them
        for (size_t i = stack.size(); i-- > 0;) {
            const VerticalFace& wall = stack[i];
            if (wall.heights[WALL_TOP_LEFT] <= newLeft + HEIGHT_EPSILON &&
                wall.heights[WALL_TOP_RIGHT] <= newRight + HEIGHT_EPSILON) {
                stack.erase(i);
            }
        }

        if (auto lowest = stack.lowestIndex()) {
            VerticalFace& wall = stack[*lowest];
            wall.heights[WALL_BOTTOM_LEFT] = newLeft;
            wall.heights[WALL_BOTTOM_RIGHT] = newRight;
            // A corner left below the new floor collapses onto it
            wall.heights[WALL_TOP_LEFT] = std::max(wall.heights[WALL_TOP_LEFT], newLeft);
            wall.heights[WALL_TOP_RIGHT] = std::max(wall.heights[WALL_TOP_RIGHT], newRight);
            continue;
        }

        // Riser between old and new floor; front faces out of the sector
        VerticalFace riser = VerticalFace::fromHeights(
            {std::min(oldLeft, newLeft), std::min(oldRight, newRight),
             std::max(oldRight, newRight), std::max(oldLeft, newLeft)},
            wallTexture);
        riser.normalMode = FaceNormalMode::Back;
        // Slot is empty here, so the push cannot be rejected
        stack.push(riser);
    }

    floor = raised;
    return true;
}

} // namespace sectorforge
