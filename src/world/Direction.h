#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace sectorforge {

// Corner indices shared by every horizontal face: NW = (-X,-Z), NE = (+X,-Z),
// SE = (+X,+Z), SW = (-X,+Z)
enum Corner : uint8_t {
    CORNER_NW = 0,
    CORNER_NE = 1,
    CORNER_SE = 2,
    CORNER_SW = 3
};

// The six sides of a sector that can hold walls
enum class Direction : uint8_t {
    North = 0,  // -Z edge
    East,       // +X edge
    South,      // +Z edge
    West,       // -X edge
    NwSe,       // Diagonal from NW corner to SE corner
    NeSw,       // Diagonal from NE corner to SW corner
    COUNT
};

constexpr size_t DIRECTION_COUNT = static_cast<size_t>(Direction::COUNT);

constexpr std::array<Direction, 4> CARDINAL_DIRECTIONS = {
    Direction::North, Direction::East, Direction::South, Direction::West
};

constexpr std::array<Direction, DIRECTION_COUNT> ALL_DIRECTIONS = {
    Direction::North, Direction::East, Direction::South, Direction::West,
    Direction::NwSe, Direction::NeSw
};

inline constexpr bool isDiagonal(Direction d) {
    return d == Direction::NwSe || d == Direction::NeSw;
}

// Sector corners bounding an edge, as (left, right) seen from inside the
// sector. A wall's bottom-left/top-left corners sit on `first`, its
// bottom-right/top-right corners on `second`.
//
//   North -> (NW, NE)    East -> (NE, SE)
//   South -> (SW, SE)    West -> (NW, SW)
//   NwSe  -> (NW, SE)    NeSw -> (NE, SW)
inline constexpr std::pair<Corner, Corner> edgeCorners(Direction d) {
    switch (d) {
        case Direction::North: return {CORNER_NW, CORNER_NE};
        case Direction::East:  return {CORNER_NE, CORNER_SE};
        case Direction::South: return {CORNER_SW, CORNER_SE};
        case Direction::West:  return {CORNER_NW, CORNER_SW};
        case Direction::NwSe:  return {CORNER_NW, CORNER_SE};
        case Direction::NeSw:  return {CORNER_NE, CORNER_SW};
        case Direction::COUNT: break;
    }
    return {CORNER_NW, CORNER_NE};
}

// Grid offset (dx, dz) of the neighbouring sector across a cardinal edge
inline constexpr std::pair<int, int> directionOffset(Direction d) {
    switch (d) {
        case Direction::North: return {0, -1};
        case Direction::East:  return {1, 0};
        case Direction::South: return {0, 1};
        case Direction::West:  return {-1, 0};
        default:               return {0, 0};
    }
}

inline constexpr const char* directionName(Direction d) {
    switch (d) {
        case Direction::North: return "north";
        case Direction::East:  return "east";
        case Direction::South: return "south";
        case Direction::West:  return "west";
        case Direction::NwSe:  return "nw_se";
        case Direction::NeSw:  return "ne_sw";
        case Direction::COUNT: break;
    }
    return "unknown";
}

inline std::optional<Direction> parseDirection(std::string_view name) {
    for (Direction d : ALL_DIRECTIONS) {
        if (name == directionName(d)) {
            return d;
        }
    }
    return std::nullopt;
}

// Offset of a sector corner from the sector's NW corner, in units of SECTOR_SIZE
inline constexpr std::pair<float, float> cornerOffset(Corner c) {
    switch (c) {
        case CORNER_NW: return {0.0f, 0.0f};
        case CORNER_NE: return {1.0f, 0.0f};
        case CORNER_SE: return {1.0f, 1.0f};
        case CORNER_SW: return {0.0f, 1.0f};
    }
    return {0.0f, 0.0f};
}

} // namespace sectorforge
