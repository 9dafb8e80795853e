#pragma once

#include "Room.h"

#include <glm/glm.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace sectorforge {

// Texture pack used by the built-in starter levels
inline constexpr const char* DEFAULT_TEXTURE_PACK = "retro-texture-pack";

/**
 * Ordered collection of rooms. Room indices are stable until a room is
 * removed.
 */
class Level {
public:
    Level() = default;

    // Append a room, returning its index
    size_t addRoom(Room room);
    bool removeRoom(size_t index);

    size_t roomCount() const { return rooms.size(); }
    bool empty() const { return rooms.empty(); }

    Room* getRoom(size_t index) { return index < rooms.size() ? &rooms[index] : nullptr; }
    const Room* getRoom(size_t index) const { return index < rooms.size() ? &rooms[index] : nullptr; }

    std::vector<Room>& getRooms() { return rooms; }
    const std::vector<Room>& getRooms() const { return rooms; }

    // First room whose world bounds contain the point
    std::optional<size_t> findRoomAt(const glm::vec3& point) const;

    // Try the hinted room first, then fall back to a linear search
    std::optional<size_t> findRoomAtWithHint(const glm::vec3& point, std::optional<size_t> hint) const;

    void recalculateAllBounds();

    size_t sectorCount() const;
    size_t wallCount() const;

private:
    std::vector<Room> rooms;
};

// One 1x1 room with a floor at height 0
Level createEmptyLevel();

// One enclosed 1x1 room: floor 0, ceiling 1024, a wall on every cardinal edge
Level createTestLevel();

} // namespace sectorforge
