#include "LevelLimits.h"

#include <nlohmann/json.hpp>
#include <SDL3/SDL_log.h>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

namespace sectorforge {

LevelLimits LevelLimits::loadFromJson(const std::string& jsonPath) {
    std::ifstream file(jsonPath);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "LevelLimits: Failed to open limits file: %s", jsonPath.c_str());
        return defaults();
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    return loadFromJsonString(content);
}

LevelLimits LevelLimits::loadFromJsonString(const std::string& jsonString) {
    LevelLimits limits;

    try {
        json j = json::parse(jsonString);

        limits.maxRooms = j.value("maxRooms", limits.maxRooms);
        limits.maxRoomSize = j.value("maxRoomSize", limits.maxRoomSize);
        limits.maxStringLength = j.value("maxStringLength", limits.maxStringLength);
        limits.maxCoord = j.value("maxCoord", limits.maxCoord);
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "LevelLimits: JSON parse error: %s", e.what());
        return defaults();
    }

    return limits;
}

} // namespace sectorforge
