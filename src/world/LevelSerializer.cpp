#include "LevelSerializer.h"
#include "LevelValidator.h"

#include <nlohmann/json.hpp>
#include <SDL3/SDL_log.h>
#include <fstream>
#include <iterator>
#include <stdexcept>

using json = nlohmann::json;

namespace sectorforge {

namespace {

// Structural problems that nlohmann does not detect on its own
class LevelFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

json textureToJson(const TextureRef& texture) {
    return json{{"pack", texture.pack}, {"name", texture.name}};
}

json colorToJson(const Color& color) {
    return json{{"r", color.r}, {"g", color.g}, {"b", color.b}, {"blend", blendModeName(color.blend)}};
}

json colorsToJson(const std::array<Color, 4>& colors) {
    json arr = json::array();
    for (const auto& c : colors) arr.push_back(colorToJson(c));
    return arr;
}

json uvToJson(const std::array<glm::vec2, 4>& uv) {
    json arr = json::array();
    for (const auto& t : uv) arr.push_back(json::array({t.x, t.y}));
    return arr;
}

json horizontalToJson(const HorizontalFace& face) {
    json j;
    j["heights"] = face.heights;
    j["split"] = splitDirectionName(face.splitDirection);
    j["texture"] = textureToJson(face.texture);
    if (face.uv) j["uv"] = uvToJson(*face.uv);
    j["colors"] = colorsToJson(face.colors);
    if (face.texture2) j["texture2"] = textureToJson(*face.texture2);
    if (face.uv2) j["uv2"] = uvToJson(*face.uv2);
    if (face.colors2) j["colors2"] = colorsToJson(*face.colors2);
    j["walkable"] = face.walkable;
    j["blend_mode"] = blendModeName(face.blendMode);
    j["normal_mode"] = normalModeName(face.normalMode);
    j["black_transparent"] = face.blackTransparent;
    return j;
}

json verticalToJson(const VerticalFace& face) {
    json j;
    j["heights"] = face.heights;
    j["texture"] = textureToJson(face.texture);
    if (face.uv) j["uv"] = uvToJson(*face.uv);
    j["colors"] = colorsToJson(face.colors);
    j["solid"] = face.solid;
    j["blend_mode"] = blendModeName(face.blendMode);
    j["normal_mode"] = normalModeName(face.normalMode);
    j["black_transparent"] = face.blackTransparent;
    j["uv_projection"] = uvProjectionName(face.uvProjection);
    return j;
}

json sectorToJson(size_t x, size_t z, const Sector& sector) {
    json j;
    j["x"] = x;
    j["z"] = z;
    if (sector.floor) j["floor"] = horizontalToJson(*sector.floor);
    if (sector.ceiling) j["ceiling"] = horizontalToJson(*sector.ceiling);

    json walls = json::object();
    for (Direction dir : ALL_DIRECTIONS) {
        const WallStack& stack = sector.walls(dir);
        if (stack.empty()) continue;
        json arr = json::array();
        for (const VerticalFace& wall : stack) arr.push_back(verticalToJson(wall));
        walls[directionName(dir)] = std::move(arr);
    }
    j["walls"] = std::move(walls);
    return j;
}

json roomToJson(const Room& room) {
    json j;
    const glm::vec3& pos = room.getPosition();
    j["id"] = room.getId();
    j["position"] = json::array({pos.x, pos.y, pos.z});
    j["width"] = room.width();
    j["depth"] = room.depth();
    j["ambient"] = room.getAmbient();

    json sectors = json::array();
    room.forEachSector([&sectors](size_t x, size_t z, const Sector& sector) {
        sectors.push_back(sectorToJson(x, z, sector));
    });
    j["sectors"] = std::move(sectors);
    return j;
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

TextureRef textureFromJson(const json& j) {
    return TextureRef(j.value("pack", std::string()), j.value("name", std::string()));
}

BlendMode blendFromJson(const json& j, const char* key) {
    if (!j.contains(key)) return BlendMode::Opaque;
    std::string name = j[key].get<std::string>();
    if (auto mode = parseBlendMode(name)) return *mode;
    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "LevelSerializer: Unknown blend mode '%s', using opaque", name.c_str());
    return BlendMode::Opaque;
}

FaceNormalMode normalModeFromJson(const json& j) {
    if (!j.contains("normal_mode")) return FaceNormalMode::Front;
    std::string name = j["normal_mode"].get<std::string>();
    if (auto mode = parseNormalMode(name)) return *mode;
    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "LevelSerializer: Unknown normal mode '%s', using front", name.c_str());
    return FaceNormalMode::Front;
}

uint8_t channelFromJson(const json& j, const char* key, uint8_t fallback) {
    if (!j.contains(key)) return fallback;
    int value = j[key].get<int>();
    if (value < 0 || value > 255) {
        throw LevelFormatError(std::string("color channel ") + key + " = " +
                               std::to_string(value) + " outside 0-255");
    }
    return static_cast<uint8_t>(value);
}

Color colorFromJson(const json& j) {
    Color color;
    color.r = channelFromJson(j, "r", Color::neutral().r);
    color.g = channelFromJson(j, "g", Color::neutral().g);
    color.b = channelFromJson(j, "b", Color::neutral().b);
    color.blend = blendFromJson(j, "blend");
    return color;
}

std::array<Color, 4> colorsFromJson(const json& j) {
    if (!j.is_array() || j.size() != 4) {
        throw LevelFormatError("colors must be an array of 4 entries");
    }
    std::array<Color, 4> colors;
    for (size_t i = 0; i < 4; ++i) colors[i] = colorFromJson(j[i]);
    return colors;
}

std::array<glm::vec2, 4> uvFromJson(const json& j) {
    if (!j.is_array() || j.size() != 4) {
        throw LevelFormatError("uv must be an array of 4 entries");
    }
    std::array<glm::vec2, 4> uv;
    for (size_t i = 0; i < 4; ++i) {
        uv[i] = glm::vec2(j[i].at(0).get<float>(), j[i].at(1).get<float>());
    }
    return uv;
}

std::array<float, 4> heightsFromJson(const json& j) {
    if (!j.is_array() || j.size() != 4) {
        throw LevelFormatError("heights must be an array of 4 values");
    }
    return j.get<std::array<float, 4>>();
}

HorizontalFace horizontalFromJson(const json& j) {
    HorizontalFace face;
    face.heights = heightsFromJson(j.at("heights"));
    face.texture = textureFromJson(j.at("texture"));

    if (j.contains("split")) {
        std::string name = j["split"].get<std::string>();
        if (auto split = parseSplitDirection(name)) {
            face.splitDirection = *split;
        } else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "LevelSerializer: Unknown split '%s', using nw_se", name.c_str());
        }
    }

    if (j.contains("uv")) face.uv = uvFromJson(j["uv"]);
    if (j.contains("colors")) face.colors = colorsFromJson(j["colors"]);
    if (j.contains("texture2")) face.texture2 = textureFromJson(j["texture2"]);
    if (j.contains("uv2")) face.uv2 = uvFromJson(j["uv2"]);
    if (j.contains("colors2")) face.colors2 = colorsFromJson(j["colors2"]);

    face.walkable = j.value("walkable", true);
    face.blendMode = blendFromJson(j, "blend_mode");
    face.normalMode = normalModeFromJson(j);
    face.blackTransparent = j.value("black_transparent", true);
    return face;
}

VerticalFace verticalFromJson(const json& j) {
    VerticalFace face;
    face.heights = heightsFromJson(j.at("heights"));
    face.texture = textureFromJson(j.at("texture"));

    if (j.contains("uv")) face.uv = uvFromJson(j["uv"]);
    if (j.contains("colors")) face.colors = colorsFromJson(j["colors"]);

    face.solid = j.value("solid", true);
    face.blendMode = blendFromJson(j, "blend_mode");
    face.normalMode = normalModeFromJson(j);
    face.blackTransparent = j.value("black_transparent", true);

    if (j.contains("uv_projection")) {
        std::string name = j["uv_projection"].get<std::string>();
        if (auto projection = parseUvProjection(name)) {
            face.uvProjection = *projection;
        } else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "LevelSerializer: Unknown uv projection '%s'", name.c_str());
        }
    }
    return face;
}

Sector sectorFromJson(const json& j) {
    Sector sector;
    if (j.contains("floor")) sector.floor = horizontalFromJson(j["floor"]);
    if (j.contains("ceiling")) sector.ceiling = horizontalFromJson(j["ceiling"]);

    if (!j.contains("walls")) return sector;

    for (const auto& [key, arr] : j["walls"].items()) {
        auto dir = parseDirection(key);
        if (!dir) {
            throw LevelFormatError("unknown wall slot '" + key + "'");
        }
        if (arr.size() > MAX_WALLS_PER_EDGE) {
            throw LevelFormatError("too many " + key + " walls (" + std::to_string(arr.size()) +
                                   " > " + std::to_string(MAX_WALLS_PER_EDGE) + ")");
        }
        WallStack& stack = sector.walls(*dir);
        for (const auto& wall : arr) {
            if (!stack.push(verticalFromJson(wall))) {
                throw LevelFormatError("wall slot '" + key + "' is full");
            }
        }
    }
    return sector;
}

Room roomFromJson(const json& j, size_t index, const LevelLimits& limits) {
    size_t width = j.at("width").get<size_t>();
    size_t depth = j.at("depth").get<size_t>();

    // Checked before allocating the grid
    if (width == 0 || depth == 0 || width > limits.maxRoomSize || depth > limits.maxRoomSize) {
        throw LevelFormatError("room[" + std::to_string(index) + "]: invalid size " +
                               std::to_string(width) + "x" + std::to_string(depth));
    }

    glm::vec3 position(0.0f);
    if (j.contains("position")) {
        const auto& p = j["position"];
        position = glm::vec3(p.at(0).get<float>(), p.at(1).get<float>(), p.at(2).get<float>());
    }

    Room room(j.value("id", static_cast<uint32_t>(index)), position, width, depth);
    room.setAmbient(j.value("ambient", 0.5f));

    if (j.contains("sectors")) {
        for (const auto& s : j["sectors"]) {
            size_t x = s.at("x").get<size_t>();
            size_t z = s.at("z").get<size_t>();
            if (room.getSector(x, z)) {
                throw LevelFormatError("room[" + std::to_string(index) + "]: sector (" +
                                       std::to_string(x) + ", " + std::to_string(z) + ") listed twice");
            }
            if (!room.setSector(x, z, sectorFromJson(s))) {
                throw LevelFormatError("room[" + std::to_string(index) + "]: sector (" +
                                       std::to_string(x) + ", " + std::to_string(z) + ") outside grid");
            }
        }
    }

    room.recalculateBounds();
    return room;
}

} // anonymous namespace

std::optional<Level> LevelSerializer::loadFromFile(const std::string& path, const LevelLimits& limits) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "LevelSerializer: Failed to open %s", path.c_str());
        return std::nullopt;
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    auto level = loadFromString(content, limits);
    if (level) {
        SDL_Log("LevelSerializer: Loaded %zu rooms from %s", level->roomCount(), path.c_str());
    }
    return level;
}

std::optional<Level> LevelSerializer::loadFromString(const std::string& jsonString, const LevelLimits& limits) {
    Level level;

    try {
        json j = json::parse(jsonString);

        int version = j.value("version", FORMAT_VERSION);
        if (version > FORMAT_VERSION) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "LevelSerializer: Unsupported version %d", version);
            return std::nullopt;
        }

        const auto& rooms = j.at("rooms");
        if (rooms.size() > limits.maxRooms) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "LevelSerializer: too many rooms (%zu > %zu)",
                         rooms.size(), limits.maxRooms);
            return std::nullopt;
        }

        for (size_t i = 0; i < rooms.size(); ++i) {
            level.addRoom(roomFromJson(rooms[i], i, limits));
        }
    } catch (const std::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "LevelSerializer: Failed to parse level: %s", e.what());
        return std::nullopt;
    }

    ValidationResult result = LevelValidator(limits).validate(level);
    if (!result) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "LevelSerializer: Validation failed: %s", result.error.c_str());
        return std::nullopt;
    }

    return level;
}

std::string LevelSerializer::saveToString(const Level& level) {
    json j;
    j["version"] = FORMAT_VERSION;

    json rooms = json::array();
    for (const Room& room : level.getRooms()) {
        rooms.push_back(roomToJson(room));
    }
    j["rooms"] = std::move(rooms);

    return j.dump(2);
}

bool LevelSerializer::saveToFile(const Level& level, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "LevelSerializer: Failed to open %s for writing", path.c_str());
        return false;
    }

    file << saveToString(level);
    if (!file) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "LevelSerializer: Failed to write %s", path.c_str());
        return false;
    }

    SDL_Log("LevelSerializer: Saved %zu rooms to %s", level.roomCount(), path.c_str());
    return true;
}

} // namespace sectorforge
