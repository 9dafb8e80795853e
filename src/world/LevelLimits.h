#pragma once

#include <cstddef>
#include <string>

namespace sectorforge {

// Upper bounds enforced when validating a level
struct LevelLimits {
    size_t maxRooms = 256;
    size_t maxRoomSize = 128;       // Per axis, in sectors
    size_t maxStringLength = 256;   // Texture pack / name
    float maxCoord = 1000000.0f;    // Absolute value of any height or position

    static LevelLimits defaults() { return LevelLimits(); }

    // Missing keys keep their defaults. A file that cannot be read or parsed
    // yields the defaults.
    static LevelLimits loadFromJson(const std::string& jsonPath);
    static LevelLimits loadFromJsonString(const std::string& jsonString);
};

} // namespace sectorforge
