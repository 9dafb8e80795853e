#include "Room.h"

#include <SDL3/SDL_log.h>
#include <cmath>
#include <utility>

namespace sectorforge {

Room::Room(uint32_t roomId, const glm::vec3& roomPosition, size_t width, size_t depth)
    : id(roomId)
    , position(roomPosition)
    , gridWidth(width)
    , gridDepth(depth)
    , arenaWidth(width)
    , arenaDepth(depth) {
    cells.resize(arenaWidth * arenaDepth);
}

Room::Room(const Room& other)
    : id(other.id)
    , position(other.position)
    , ambient(other.ambient)
    , gridWidth(other.gridWidth)
    , gridDepth(other.gridDepth)
    , arenaWidth(other.gridWidth)
    , arenaDepth(other.gridDepth)
    , bounds(other.bounds) {
    // Copies are compacted to the live window
    cells.resize(arenaWidth * arenaDepth);
    for (size_t z = 0; z < gridDepth; ++z) {
        for (size_t x = 0; x < gridWidth; ++x) {
            if (const Sector* sector = other.getSector(x, z)) {
                cells[arenaIndex(x, z)] = std::make_unique<Sector>(*sector);
            }
        }
    }
}

Room& Room::operator=(const Room& other) {
    if (this != &other) {
        Room copy(other);
        *this = std::move(copy);
    }
    return *this;
}

Room::Room(Room&& other) noexcept
    : id(other.id)
    , position(other.position)
    , ambient(other.ambient)
    , gridWidth(std::exchange(other.gridWidth, 0))
    , gridDepth(std::exchange(other.gridDepth, 0))
    , cells(std::move(other.cells))
    , arenaWidth(std::exchange(other.arenaWidth, 0))
    , arenaDepth(std::exchange(other.arenaDepth, 0))
    , originX(std::exchange(other.originX, 0))
    , originZ(std::exchange(other.originZ, 0))
    , bounds(std::exchange(other.bounds, AABB{})) {
    other.cells.clear();
}

Room& Room::operator=(Room&& other) noexcept {
    if (this != &other) {
        id = other.id;
        position = other.position;
        ambient = other.ambient;
        gridWidth = std::exchange(other.gridWidth, 0);
        gridDepth = std::exchange(other.gridDepth, 0);
        cells = std::move(other.cells);
        other.cells.clear();
        arenaWidth = std::exchange(other.arenaWidth, 0);
        arenaDepth = std::exchange(other.arenaDepth, 0);
        originX = std::exchange(other.originX, 0);
        originZ = std::exchange(other.originZ, 0);
        bounds = std::exchange(other.bounds, AABB{});
    }
    return *this;
}

Sector* Room::getSector(size_t x, size_t z) {
    if (x >= gridWidth || z >= gridDepth) return nullptr;
    return cells[arenaIndex(x, z)].get();
}

const Sector* Room::getSector(size_t x, size_t z) const {
    if (x >= gridWidth || z >= gridDepth) return nullptr;
    return cells[arenaIndex(x, z)].get();
}

bool Room::setSector(size_t x, size_t z, Sector sector) {
    if (x >= gridWidth || z >= gridDepth) return false;
    cells[arenaIndex(x, z)] = std::make_unique<Sector>(std::move(sector));
    return true;
}

bool Room::removeSector(size_t x, size_t z) {
    if (x >= gridWidth || z >= gridDepth) return false;
    cells[arenaIndex(x, z)].reset();
    return true;
}

Sector& Room::ensureSector(size_t x, size_t z) {
    if (x >= gridWidth) {
        grow(Direction::East, x - gridWidth + 1);
    }
    if (z >= gridDepth) {
        grow(Direction::South, z - gridDepth + 1);
    }

    auto& cell = cells[arenaIndex(x, z)];
    if (!cell) {
        cell = std::make_unique<Sector>();
    }
    return *cell;
}

GridCoord Room::growToInclude(int gx, int gz) {
    if (gx < 0) {
        grow(Direction::West, static_cast<size_t>(-gx));
        gx = 0;
    } else if (static_cast<size_t>(gx) >= gridWidth) {
        grow(Direction::East, static_cast<size_t>(gx) - gridWidth + 1);
    }

    if (gz < 0) {
        grow(Direction::North, static_cast<size_t>(-gz));
        gz = 0;
    } else if (static_cast<size_t>(gz) >= gridDepth) {
        grow(Direction::South, static_cast<size_t>(gz) - gridDepth + 1);
    }

    return GridCoord{static_cast<size_t>(gx), static_cast<size_t>(gz)};
}

void Room::grow(Direction side, size_t count) {
    if (count == 0) return;

    const float shift = static_cast<float>(count) * SECTOR_SIZE;

    switch (side) {
        case Direction::West:
            if (originX < count) {
                reserveArena(count + ARENA_PADDING, 0, 0, 0);
            }
            originX -= count;
            gridWidth += count;
            position.x -= shift;
            break;
        case Direction::East:
            if (originX + gridWidth + count > arenaWidth) {
                reserveArena(0, count + ARENA_PADDING, 0, 0);
            }
            gridWidth += count;
            break;
        case Direction::North:
            if (originZ < count) {
                reserveArena(0, 0, count + ARENA_PADDING, 0);
            }
            originZ -= count;
            gridDepth += count;
            position.z -= shift;
            break;
        case Direction::South:
            if (originZ + gridDepth + count > arenaDepth) {
                reserveArena(0, 0, 0, count + ARENA_PADDING);
            }
            gridDepth += count;
            break;
        default:
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Room %u: cannot grow toward %s",
                        id, directionName(side));
            break;
    }
}

void Room::reserveArena(size_t west, size_t east, size_t north, size_t south) {
    size_t newWidth = arenaWidth + west + east;
    size_t newDepth = arenaDepth + north + south;

    std::vector<std::unique_ptr<Sector>> newCells(newWidth * newDepth);
    for (size_t z = 0; z < arenaDepth; ++z) {
        for (size_t x = 0; x < arenaWidth; ++x) {
            auto& cell = cells[z * arenaWidth + x];
            if (cell) {
                newCells[(z + north) * newWidth + (x + west)] = std::move(cell);
            }
        }
    }

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Room %u: arena %zux%zu -> %zux%zu",
                 id, arenaWidth, arenaDepth, newWidth, newDepth);

    cells = std::move(newCells);
    arenaWidth = newWidth;
    arenaDepth = newDepth;
    originX += west;
    originZ += north;
}

void Room::setFloor(size_t x, size_t z, float height, const TextureRef& texture) {
    ensureSector(x, z).floor = HorizontalFace::flat(height, texture);
}

void Room::setCeiling(size_t x, size_t z, float height, const TextureRef& texture) {
    ensureSector(x, z).ceiling = HorizontalFace::flat(height, texture);
}

bool Room::addWall(size_t x, size_t z, Direction dir, float yBottom, float yTop, const TextureRef& texture) {
    Sector& sector = ensureSector(x, z);
    if (!sector.walls(dir).push(VerticalFace(yBottom, yTop, texture))) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Room %u: %s edge of sector (%zu, %zu) is full",
                    id, directionName(dir), x, z);
        return false;
    }
    return true;
}

WallFit Room::placeWall(size_t x, size_t z, Direction dir, const TextureRef& texture,
                        std::optional<float> preferredY, float fallbackFloor, float fallbackCeiling) {
    Sector& sector = ensureSector(x, z);
    WallFit fit = GapSolver::nextWallPosition(sector, dir, fallbackFloor, fallbackCeiling, preferredY);
    if (!fit) {
        return fit;
    }

    if (!sector.walls(dir).push(VerticalFace::fromHeights(fit.heights, texture))) {
        return WallFit::slotFull();
    }
    recalculateBounds();
    return fit;
}

size_t Room::encloseOpenEdges(const TextureRef& wallTexture) {
    size_t placed = 0;

    for (size_t z = 0; z < gridDepth; ++z) {
        for (size_t x = 0; x < gridWidth; ++x) {
            Sector* sector = getSector(x, z);
            if (!sector || !sector->floor) continue;

            for (Direction dir : CARDINAL_DIRECTIONS) {
                if (!sector->walls(dir).empty()) continue;

                auto [dx, dz] = directionOffset(dir);
                long nx = static_cast<long>(x) + dx;
                long nz = static_cast<long>(z) + dz;
                const Sector* neighbour = (nx >= 0 && nz >= 0)
                    ? getSector(static_cast<size_t>(nx), static_cast<size_t>(nz))
                    : nullptr;
                if (neighbour && neighbour->floor) continue;

                float floorHeight = sector->floor->edgeMin(dir);
                WallFit fit = GapSolver::nextWallPosition(*sector, dir, floorHeight,
                                                          floorHeight + DEFAULT_CEILING_HEIGHT);
                if (fit && sector->walls(dir).push(VerticalFace::fromHeights(fit.heights, wallTexture))) {
                    ++placed;
                }
            }
        }
    }

    if (placed > 0) {
        recalculateBounds();
    }
    return placed;
}

bool Room::extrudeFloor(size_t x, size_t z, float amount, const TextureRef& wallTexture) {
    Sector* sector = getSector(x, z);
    if (!sector || !sector->extrudeFloor(amount, wallTexture)) {
        return false;
    }
    recalculateBounds();
    return true;
}

std::optional<GridCoord> Room::worldToGrid(float worldX, float worldZ) const {
    float localX = worldX - position.x;
    float localZ = worldZ - position.z;

    if (localX < 0.0f || localZ < 0.0f) {
        return std::nullopt;
    }

    size_t gx = static_cast<size_t>(std::floor(localX / SECTOR_SIZE));
    size_t gz = static_cast<size_t>(std::floor(localZ / SECTOR_SIZE));

    if (gx >= gridWidth || gz >= gridDepth) {
        return std::nullopt;
    }
    return GridCoord{gx, gz};
}

glm::vec3 Room::gridToWorld(size_t x, size_t z) const {
    return glm::vec3(position.x + static_cast<float>(x) * SECTOR_SIZE,
                     position.y,
                     position.z + static_cast<float>(z) * SECTOR_SIZE);
}

void Room::recalculateBounds() {
    bounds = AABB();

    forEachSector([this](size_t x, size_t z, const Sector& sector) {
        const float baseX = static_cast<float>(x) * SECTOR_SIZE;
        const float baseZ = static_cast<float>(z) * SECTOR_SIZE;

        auto cornerPoint = [&](Corner corner, float height) {
            auto [dx, dz] = cornerOffset(corner);
            return glm::vec3(baseX + dx * SECTOR_SIZE, height, baseZ + dz * SECTOR_SIZE);
        };

        for (const auto* face : {&sector.floor, &sector.ceiling}) {
            if (!*face) continue;
            for (size_t i = 0; i < 4; ++i) {
                bounds.expand(cornerPoint(static_cast<Corner>(i), (*face)->heights[i]));
            }
        }

        // Walls can reach past the floor and ceiling
        for (Direction dir : ALL_DIRECTIONS) {
            auto [left, right] = edgeCorners(dir);
            for (const VerticalFace& wall : sector.walls(dir)) {
                bounds.expand(cornerPoint(left, wall.heights[WALL_BOTTOM_LEFT]));
                bounds.expand(cornerPoint(right, wall.heights[WALL_BOTTOM_RIGHT]));
                bounds.expand(cornerPoint(right, wall.heights[WALL_TOP_RIGHT]));
                bounds.expand(cornerPoint(left, wall.heights[WALL_TOP_LEFT]));
            }
        }
    });
}

AABB Room::worldBounds() const {
    return bounds.translated(glm::vec3(position.x, 0.0f, position.z));
}

bool Room::containsPoint(const glm::vec3& point) const {
    return worldBounds().contains(point);
}

bool Room::columnHasSector(size_t x, size_t zBegin, size_t zEnd) const {
    for (size_t z = zBegin; z < zEnd; ++z) {
        if (getSector(x, z)) return true;
    }
    return false;
}

bool Room::rowHasSector(size_t z, size_t xBegin, size_t xEnd) const {
    for (size_t x = xBegin; x < xEnd; ++x) {
        if (getSector(x, z)) return true;
    }
    return false;
}

void Room::trimEmptyEdges() {
    if (gridWidth == 0 || gridDepth == 0) return;

    size_t firstCol = 0;
    while (firstCol < gridWidth && !columnHasSector(firstCol, 0, gridDepth)) {
        ++firstCol;
    }

    size_t lastCol = gridWidth;
    while (lastCol > firstCol && !columnHasSector(lastCol - 1, 0, gridDepth)) {
        --lastCol;
    }

    size_t firstRow = 0;
    while (firstRow < gridDepth && !rowHasSector(firstRow, firstCol, lastCol)) {
        ++firstRow;
    }

    size_t lastRow = gridDepth;
    while (lastRow > firstRow && !rowHasSector(lastRow - 1, firstCol, lastCol)) {
        --lastRow;
    }

    // Nothing left: keep a single empty cell where the grid starts
    if (firstCol >= lastCol || firstRow >= lastRow) {
        gridWidth = 1;
        gridDepth = 1;
        return;
    }

    if (firstCol == 0 && firstRow == 0 && lastCol == gridWidth && lastRow == gridDepth) {
        return;
    }

    // Every cell outside the kept window is already empty, so only the
    // origin and the world position move
    originX += firstCol;
    originZ += firstRow;
    gridWidth = lastCol - firstCol;
    gridDepth = lastRow - firstRow;
    position.x += static_cast<float>(firstCol) * SECTOR_SIZE;
    position.z += static_cast<float>(firstRow) * SECTOR_SIZE;
}

size_t Room::cleanupEmptySectors() {
    size_t removed = 0;
    for (size_t z = 0; z < gridDepth; ++z) {
        for (size_t x = 0; x < gridWidth; ++x) {
            auto& cell = cells[arenaIndex(x, z)];
            if (cell && !cell->hasGeometry()) {
                cell.reset();
                ++removed;
            }
        }
    }
    trimEmptyEdges();
    return removed;
}

size_t Room::sectorCount() const {
    size_t count = 0;
    forEachSector([&count](size_t, size_t, const Sector&) { ++count; });
    return count;
}

} // namespace sectorforge
