#include "Level.h"

#include <utility>

namespace sectorforge {

size_t Level::addRoom(Room room) {
    rooms.push_back(std::move(room));
    return rooms.size() - 1;
}

bool Level::removeRoom(size_t index) {
    if (index >= rooms.size()) return false;
    rooms.erase(rooms.begin() + static_cast<std::ptrdiff_t>(index));
    return true;
}

std::optional<size_t> Level::findRoomAt(const glm::vec3& point) const {
    for (size_t i = 0; i < rooms.size(); ++i) {
        if (rooms[i].containsPoint(point)) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<size_t> Level::findRoomAtWithHint(const glm::vec3& point, std::optional<size_t> hint) const {
    if (hint && *hint < rooms.size() && rooms[*hint].containsPoint(point)) {
        return hint;
    }
    return findRoomAt(point);
}

void Level::recalculateAllBounds() {
    for (auto& room : rooms) {
        room.recalculateBounds();
    }
}

size_t Level::sectorCount() const {
    size_t count = 0;
    for (const auto& room : rooms) {
        count += room.sectorCount();
    }
    return count;
}

size_t Level::wallCount() const {
    size_t count = 0;
    for (const auto& room : rooms) {
        room.forEachSector([&count](size_t, size_t, const Sector& sector) {
            count += sector.wallCount();
        });
    }
    return count;
}

Level createEmptyLevel() {
    Level level;

    Room room(0, glm::vec3(0.0f), 1, 1);
    room.setFloor(0, 0, 0.0f, TextureRef(DEFAULT_TEXTURE_PACK, "FLOOR_1A"));
    room.recalculateBounds();

    level.addRoom(std::move(room));
    return level;
}

Level createTestLevel() {
    Level level;

    Room room(0, glm::vec3(0.0f), 1, 1);
    const TextureRef floorTex(DEFAULT_TEXTURE_PACK, "FLOOR_1A");
    const TextureRef wallTex(DEFAULT_TEXTURE_PACK, "WALL_1A");

    room.setFloor(0, 0, 0.0f, floorTex);
    room.setCeiling(0, 0, SECTOR_SIZE, floorTex);

    for (Direction dir : CARDINAL_DIRECTIONS) {
        room.addWall(0, 0, dir, 0.0f, SECTOR_SIZE, wallTex);
    }

    room.recalculateBounds();
    level.addRoom(std::move(room));
    return level;
}

} // namespace sectorforge
