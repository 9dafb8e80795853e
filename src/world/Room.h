#pragma once

#include "AABB.h"
#include "Direction.h"
#include "GapSolver.h"
#include "Sector.h"
#include "WorldConstants.h"

#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace sectorforge {

// Cell index in a room grid
struct GridCoord {
    size_t x = 0;
    size_t z = 0;

    bool operator==(const GridCoord& other) const {
        return x == other.x && z == other.z;
    }

    bool operator!=(const GridCoord& other) const {
        return !(*this == other);
    }
};

/**
 * A room: a width x depth grid of optional sectors.
 *
 * position is the world-space NW corner of cell (0, 0). Face heights are
 * world-space Y values; position.y does not offset them.
 *
 * Cells live in a padded backing arena addressed through an origin offset.
 * grow() adds rows/columns on any side as one step: growing West or North
 * moves the origin inside the arena (reallocating only when the padding runs
 * out) and moves position back by SECTOR_SIZE per inserted row/column, so
 * every existing sector keeps its world-space location.
 */
class Room {
public:
    Room() : Room(0, glm::vec3(0.0f), 1, 1) {}
    Room(uint32_t id, const glm::vec3& position, size_t width, size_t depth);

    Room(const Room& other);
    Room& operator=(const Room& other);
    // Moved-from rooms are left as an empty 0x0 grid
    Room(Room&& other) noexcept;
    Room& operator=(Room&& other) noexcept;
    ~Room() = default;

    uint32_t getId() const { return id; }
    void setId(uint32_t newId) { id = newId; }

    const glm::vec3& getPosition() const { return position; }
    void setPosition(const glm::vec3& newPosition) { position = newPosition; }

    float getAmbient() const { return ambient; }
    void setAmbient(float value) { ambient = value; }

    size_t width() const { return gridWidth; }
    size_t depth() const { return gridDepth; }

    // Sector at a cell, nullptr when out of range or unset
    Sector* getSector(size_t x, size_t z);
    const Sector* getSector(size_t x, size_t z) const;

    // Replace a cell's sector. Returns false when the cell is out of range.
    bool setSector(size_t x, size_t z, Sector sector);
    bool removeSector(size_t x, size_t z);

    // Sector at (x, z), growing East/South and creating an empty sector as needed
    Sector& ensureSector(size_t x, size_t z);

    /**
     * Grow the grid so that the signed cell (gx, gz) exists.
     * Negative indices grow West/North and shift everything already placed
     * to higher indices.
     * @return The cell's index after growth
     */
    GridCoord growToInclude(int gx, int gz);

    // Add `count` rows/columns on a cardinal side; diagonals are ignored
    void grow(Direction side, size_t count = 1);

    void setFloor(size_t x, size_t z, float height, const TextureRef& texture);
    void setCeiling(size_t x, size_t z, float height, const TextureRef& texture);

    // Stack a level wall on an edge. Returns false when the edge is full.
    bool addWall(size_t x, size_t z, Direction dir, float yBottom, float yTop, const TextureRef& texture);

    /**
     * Ask the gap solver for the next wall on an edge and insert it.
     * A missing floor/ceiling uses fallbackFloor/fallbackCeiling.
     * @return The solver's result; the wall is inserted only when it fits
     */
    WallFit placeWall(size_t x, size_t z, Direction dir, const TextureRef& texture,
                      std::optional<float> preferredY = std::nullopt,
                      float fallbackFloor = 0.0f,
                      float fallbackCeiling = DEFAULT_CEILING_HEIGHT);

    /**
     * Close every open cardinal edge of floored sectors: an edge whose
     * neighbour cell is outside the grid or has no floor, and whose wall
     * slot is empty, gets the wall the gap solver proposes.
     * @return Number of walls placed
     */
    size_t encloseOpenEdges(const TextureRef& wallTexture);

    // Raise a sector's floor and close the step with walls (see Sector::extrudeFloor)
    bool extrudeFloor(size_t x, size_t z, float amount, const TextureRef& wallTexture);

    std::optional<GridCoord> worldToGrid(float worldX, float worldZ) const;
    glm::vec3 gridToWorld(size_t x, size_t z) const;

    // Room-relative bounds over all floor, ceiling and wall corners. Must be
    // called after any edit that changes heights.
    void recalculateBounds();
    const AABB& getBounds() const { return bounds; }
    AABB worldBounds() const;
    bool containsPoint(const glm::vec3& point) const;

    // Drop empty boundary rows/columns, keeping sectors in place in world space
    void trimEmptyEdges();

    // Remove sectors without geometry, then trim. Returns sectors removed.
    size_t cleanupEmptySectors();

    size_t sectorCount() const;

    template<typename Func>
    void forEachSector(Func&& func) const {
        for (size_t z = 0; z < gridDepth; ++z) {
            for (size_t x = 0; x < gridWidth; ++x) {
                if (const Sector* sector = getSector(x, z)) {
                    func(x, z, *sector);
                }
            }
        }
    }

    template<typename Func>
    void forEachSector(Func&& func) {
        for (size_t z = 0; z < gridDepth; ++z) {
            for (size_t x = 0; x < gridWidth; ++x) {
                if (Sector* sector = getSector(x, z)) {
                    func(x, z, *sector);
                }
            }
        }
    }

private:
    // Extra rows/columns reserved on a side when the arena must be enlarged
    static constexpr size_t ARENA_PADDING = 4;

    size_t arenaIndex(size_t x, size_t z) const {
        return (originZ + z) * arenaWidth + (originX + x);
    }

    // Enlarge the arena by the given margins, keeping the live window's contents
    void reserveArena(size_t west, size_t east, size_t north, size_t south);

    bool columnHasSector(size_t x, size_t zBegin, size_t zEnd) const;
    bool rowHasSector(size_t z, size_t xBegin, size_t xEnd) const;

    uint32_t id = 0;
    glm::vec3 position{0.0f};
    float ambient = 0.5f;

    size_t gridWidth = 0;
    size_t gridDepth = 0;

    std::vector<std::unique_ptr<Sector>> cells;
    size_t arenaWidth = 0;
    size_t arenaDepth = 0;
    size_t originX = 0;
    size_t originZ = 0;

    AABB bounds;
};

} // namespace sectorforge
