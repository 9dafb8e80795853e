#pragma once

#include "Level.h"
#include "LevelLimits.h"

#include <optional>
#include <string>

namespace sectorforge {

/**
 * JSON persistence for levels.
 *
 * Every field is written. Fields that older files may lack are read with
 * their defaults. Rooms are stored sparsely: only occupied cells appear in
 * a room's "sectors" array. Bounds are not stored; they are recalculated
 * after loading. Loaded levels are checked with LevelValidator against the
 * given limits.
 */
class LevelSerializer {
public:
    static constexpr int FORMAT_VERSION = 1;

    static std::optional<Level> loadFromFile(const std::string& path,
                                             const LevelLimits& limits = LevelLimits());
    static std::optional<Level> loadFromString(const std::string& jsonString,
                                               const LevelLimits& limits = LevelLimits());

    static bool saveToFile(const Level& level, const std::string& path);
    static std::string saveToString(const Level& level);
};

} // namespace sectorforge
