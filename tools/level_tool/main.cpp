#include "world/Level.h"
#include "world/LevelLimits.h"
#include "world/LevelSerializer.h"
#include "world/LevelValidator.h"

#include <SDL3/SDL_log.h>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>

using namespace sectorforge;

namespace {

struct ExtrudeRequest {
    size_t x = 0;
    size_t z = 0;
    float amount = 0.0f;
};

void printUsage(const char* programName) {
    SDL_Log("Usage: %s [input.json] [options]", programName);
    SDL_Log(" ");
    SDL_Log("Options:");
    SDL_Log("  --create-test            Start from a single enclosed room");
    SDL_Log("  --create-empty           Start from a single floor sector");
    SDL_Log("  --info                   Print room, sector and wall counts");
    SDL_Log("  --cleanup                Remove empty sectors and trim room grids");
    SDL_Log("  --enclose                Wall off every open edge");
    SDL_Log("  --extrude <x,z,amount>   Raise a floor and close the step");
    SDL_Log("  --room <index>           Room used by --extrude (default: 0)");
    SDL_Log("  --wall-texture <name>    Wall texture for --enclose/--extrude (default: WALL_1A)");
    SDL_Log("  --limits <path>          JSON file overriding validation limits");
    SDL_Log("  -o, --output <path>      Write the resulting level");
    SDL_Log("  -h, --help               Show this help message");
}

std::optional<ExtrudeRequest> parseExtrude(const char* arg) {
    unsigned long x = 0;
    unsigned long z = 0;
    float amount = 0.0f;
    if (std::sscanf(arg, "%lu,%lu,%f", &x, &z, &amount) != 3) {
        return std::nullopt;
    }
    ExtrudeRequest request;
    request.x = x;
    request.z = z;
    request.amount = amount;
    return request;
}

void printInfo(const Level& level) {
    SDL_Log("Rooms: %zu", level.roomCount());
    SDL_Log("Sectors: %zu", level.sectorCount());
    SDL_Log("Walls: %zu", level.wallCount());

    const auto& rooms = level.getRooms();
    for (size_t i = 0; i < rooms.size(); ++i) {
        const Room& room = rooms[i];
        const glm::vec3& pos = room.getPosition();
        SDL_Log("  room[%zu] id=%u grid=%zux%zu position=(%.0f, %.0f, %.0f) sectors=%zu",
                i, room.getId(), room.width(), room.depth(), pos.x, pos.y, pos.z, room.sectorCount());

        AABB bounds = room.worldBounds();
        if (bounds.isValid()) {
            SDL_Log("    bounds (%.0f, %.0f, %.0f) - (%.0f, %.0f, %.0f)",
                    bounds.min.x, bounds.min.y, bounds.min.z,
                    bounds.max.x, bounds.max.y, bounds.max.z);
        } else {
            SDL_Log("    bounds empty");
        }
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string inputPath;
    std::string outputPath;
    std::string limitsPath;
    std::string wallTextureName = "WALL_1A";
    bool createTest = false;
    bool createEmpty = false;
    bool showInfo = false;
    bool cleanup = false;
    bool enclose = false;
    std::optional<ExtrudeRequest> extrude;
    size_t extrudeRoom = 0;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        }
        else if ((strcmp(argv[i], "-o") == 0 || strcmp(argv[i], "--output") == 0) && i + 1 < argc) {
            outputPath = argv[++i];
        }
        else if (strcmp(argv[i], "--limits") == 0 && i + 1 < argc) {
            limitsPath = argv[++i];
        }
        else if (strcmp(argv[i], "--create-test") == 0) {
            createTest = true;
        }
        else if (strcmp(argv[i], "--create-empty") == 0) {
            createEmpty = true;
        }
        else if (strcmp(argv[i], "--info") == 0) {
            showInfo = true;
        }
        else if (strcmp(argv[i], "--cleanup") == 0) {
            cleanup = true;
        }
        else if (strcmp(argv[i], "--enclose") == 0) {
            enclose = true;
        }
        else if (strcmp(argv[i], "--extrude") == 0 && i + 1 < argc) {
            extrude = parseExtrude(argv[++i]);
            if (!extrude) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Invalid --extrude argument: %s (expected x,z,amount)", argv[i]);
                return 1;
            }
        }
        else if (strcmp(argv[i], "--room") == 0 && i + 1 < argc) {
            extrudeRoom = static_cast<size_t>(std::strtoul(argv[++i], nullptr, 10));
        }
        else if (strcmp(argv[i], "--wall-texture") == 0 && i + 1 < argc) {
            wallTextureName = argv[++i];
        }
        else if (argv[i][0] != '-' && inputPath.empty()) {
            inputPath = argv[i];
        }
        else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Unknown option: %s", argv[i]);
        }
    }

    LevelLimits limits = limitsPath.empty() ? LevelLimits::defaults() : LevelLimits::loadFromJson(limitsPath);

    std::optional<Level> level;
    if (createTest) {
        level = createTestLevel();
    } else if (createEmpty) {
        level = createEmptyLevel();
    } else if (!inputPath.empty()) {
        level = LevelSerializer::loadFromFile(inputPath, limits);
    } else {
        printUsage(argv[0]);
        return 1;
    }

    if (!level) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to load level");
        return 1;
    }

    const TextureRef wallTexture(DEFAULT_TEXTURE_PACK, wallTextureName);

    if (extrude) {
        Room* room = level->getRoom(extrudeRoom);
        if (!room) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Room %zu does not exist", extrudeRoom);
            return 1;
        }
        if (!room->extrudeFloor(extrude->x, extrude->z, extrude->amount, wallTexture)) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Sector (%zu, %zu) has no floor to extrude",
                         extrude->x, extrude->z);
            return 1;
        }
        SDL_Log("Extruded sector (%zu, %zu) by %.0f", extrude->x, extrude->z, extrude->amount);
    }

    if (enclose) {
        size_t placed = 0;
        for (Room& room : level->getRooms()) {
            placed += room.encloseOpenEdges(wallTexture);
        }
        SDL_Log("Placed %zu walls", placed);
    }

    if (cleanup) {
        size_t removed = 0;
        for (Room& room : level->getRooms()) {
            removed += room.cleanupEmptySectors();
            room.recalculateBounds();
        }
        SDL_Log("Removed %zu empty sectors", removed);
    }

    ValidationResult validation = LevelValidator(limits).validate(*level);
    if (!validation) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Level is invalid: %s", validation.error.c_str());
        return 1;
    }

    if (showInfo) {
        printInfo(*level);
    }

    if (!outputPath.empty() && !LevelSerializer::saveToFile(*level, outputPath)) {
        return 1;
    }

    return 0;
}
